#include "EntropyTrace.h"

#include "Lattice.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace onix {

namespace {

// Labels are user text; quote them so commas and quotes survive CSV.
std::string csvQuote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Full round-trip precision; non-finite values spelled the same way as the status log.
std::string csvNumber(double v) {
    if (!std::isfinite(v)) return formatEntropy(v);
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return os.str();
}

} // namespace

EntropyTracer::EntropyTracer() = default;

void EntropyTracer::setConfig(const GovernorConfig& cfg) {
    cfg_ = cfg;
}

void EntropyTracer::clearResults() {
    results_.clear();
    summaries_.clear();
}

EntropyTracer::TraceSummary EntropyTracer::traceText(const std::string& label, const std::string& text) {
    ResonantLattice lattice(cfg_.lattice);
    lattice.inject(text);

    TraceSummary summary;
    summary.label = label;

    const int steps = (cfg_.steps > 0) ? cfg_.steps : 0;
    for (int k = 1; k <= steps; ++k) {
        lattice.step();

        TraceRow row;
        row.label = label;
        row.step = k;
        row.entropy = lattice.entropy();
        row.peak_magnitude = lattice.peakMagnitude();
        row.finite = std::isfinite(row.entropy);
        results_.push_back(row);

        if (!row.finite && summary.first_nonfinite_step == 0) {
            summary.first_nonfinite_step = k;
        }
    }

    summary.final_entropy = lattice.entropy();
    summary.verdict = Governor::classify(summary.final_entropy, cfg_.threshold, cfg_.block_nonfinite);
    summaries_.push_back(summary);
    return summary;
}

bool EntropyTracer::exportTraceCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "label,step,entropy,peak_magnitude,finite\n";
    for (const auto& row : results_) {
        out << csvQuote(row.label) << ','
            << row.step << ','
            << csvNumber(row.entropy) << ','
            << csvNumber(row.peak_magnitude) << ','
            << (row.finite ? 1 : 0) << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<EntropyTracer::TraceRow>& EntropyTracer::results() const {
    return results_;
}

const std::vector<EntropyTracer::TraceSummary>& EntropyTracer::summaries() const {
    return summaries_;
}

} // namespace onix
