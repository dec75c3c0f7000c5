#pragma once

#include <string>
#include <vector>

#include "Governor.h"

namespace onix {

class EntropyTracer {
public:
    struct TraceRow {
        std::string label;
        int step = 0;                 // 1-based step index
        double entropy = 0.0;
        double peak_magnitude = 0.0;
        bool finite = true;
    };

    struct TraceSummary {
        std::string label;
        Verdict verdict = Verdict::Verified;
        double final_entropy = 0.0;
        int first_nonfinite_step = 0; // 0 when every step stayed finite
    };

    EntropyTracer();

    void setConfig(const GovernorConfig& cfg);
    const GovernorConfig& config() const { return cfg_; }
    void clearResults();

    // Appends one row per step for `text` and returns its verdict summary.
    TraceSummary traceText(const std::string& label, const std::string& text);

    // False when the file cannot be opened.
    bool exportTraceCSV(const std::string& filename) const;

    const std::vector<TraceRow>& results() const;
    const std::vector<TraceSummary>& summaries() const;

private:
    GovernorConfig cfg_{};
    std::vector<TraceRow> results_{};
    std::vector<TraceSummary> summaries_{};
};

} // namespace onix
