#include "CommandLine.h"

#include <cmath>
#include <ostream>
#include <stdexcept>

namespace onix {

namespace {

constexpr int kMaxLatticeN = 4096;
constexpr int kMaxSteps = 1000000;
constexpr int kMinWindowPx = 64;
constexpr int kMaxWindowPx = 4096;
constexpr double kMaxFps = 1000.0;

static bool parseDouble(const std::string& s, double& out) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static bool parseInt(const std::string& s, int& out) {
    try {
        std::size_t pos = 0;
        const int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static bool isGovernorValueFlag(const std::string& arg) {
    return arg == "--size" || arg == "--dt" || arg == "--damping" ||
           arg == "--phase-twist" || arg == "--nonlinear" || arg == "--steps" ||
           arg == "--threshold";
}

// Applies one lattice/decision flag; false when the value is unparsable or out of range.
static bool applyGovernorValue(const std::string& arg, const std::string& value, GovernorConfig& g) {
    if (arg == "--size") {
        int n = 0;
        if (!parseInt(value, n) || n < 1 || n > kMaxLatticeN) return false;
        g.lattice.size_n = n;
        return true;
    }
    if (arg == "--steps") {
        int k = 0;
        if (!parseInt(value, k) || k < 0 || k > kMaxSteps) return false;
        g.steps = k;
        return true;
    }
    if (arg == "--dt") return parseDouble(value, g.lattice.dt);
    if (arg == "--damping") return parseDouble(value, g.lattice.damping);
    if (arg == "--phase-twist") return parseDouble(value, g.lattice.phase_twist);
    if (arg == "--nonlinear") return parseDouble(value, g.lattice.nonlinear_coeff);
    return parseDouble(value, g.threshold);
}

static void printGovernorFlags(std::ostream& os) {
    os << "Lattice:\n"
       << "  --size <n>          lattice edge N, 1.." << kMaxLatticeN << " (default 80)\n"
       << "  --dt <v>            time step (default 0.108)\n"
       << "  --damping <v>       damping factor per step (default 0.991)\n"
       << "  --phase-twist <v>   injected imaginary/real ratio (default 0.61)\n"
       << "  --nonlinear <v>     nonlinear coefficient (default 0.618)\n"
       << "Decision:\n"
       << "  --steps <k>         evolution steps per line, 0.." << kMaxSteps << " (default 70)\n"
       << "  --threshold <v>     block when entropy > v (default 0.618)\n"
       << "  --block-nonfinite   block lines whose entropy is NaN or infinite\n";
}

} // namespace

ParseStatus parseCommandLine(int argc, const char* const* argv, AppConfig& out, std::string& error) {
    AppConfig cfg = out;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";

        if (arg == "--help" || arg == "-h") {
            return ParseStatus::Help;
        }
        if (arg == "--headless") {
            cfg.headless = true;
            continue;
        }
        if (arg == "--no-color") {
            cfg.governor.color_log = false;
            continue;
        }
        if (arg == "--block-nonfinite") {
            cfg.governor.block_nonfinite = true;
            continue;
        }

        const bool takes_value = isGovernorValueFlag(arg) || arg == "--window" || arg == "--fps";
        if (!takes_value) {
            error = "Unknown argument: " + arg;
            return ParseStatus::Error;
        }
        if (i + 1 >= argc || !argv[i + 1]) {
            error = "Missing value for " + arg;
            return ParseStatus::Error;
        }
        const std::string value = argv[++i];
        bool ok = false;

        if (arg == "--window") {
            int px = 0;
            ok = parseInt(value, px) && px >= kMinWindowPx && px <= kMaxWindowPx;
            if (ok) cfg.window_px = px;
        } else if (arg == "--fps") {
            double fps = 0.0;
            ok = parseDouble(value, fps) && fps > 0.0 && fps <= kMaxFps;
            if (ok) cfg.fps_limit = fps;
        } else {
            ok = applyGovernorValue(arg, value, cfg.governor);
        }

        if (!ok) {
            error = "Invalid value for " + arg + ": " + value;
            return ParseStatus::Error;
        }
    }

    out = cfg;
    return ParseStatus::Ok;
}

ParseStatus parseTraceCommandLine(int argc, const char* const* argv, TraceOptions& out, std::string& error) {
    TraceOptions opts = out;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";

        if (arg == "--help" || arg == "-h") {
            return ParseStatus::Help;
        }
        if (arg == "--block-nonfinite") {
            opts.governor.block_nonfinite = true;
            continue;
        }

        const bool takes_value = isGovernorValueFlag(arg) || arg == "--text" || arg == "--in" || arg == "--out";
        if (!takes_value) {
            error = "Unknown argument: " + arg;
            return ParseStatus::Error;
        }
        if (i + 1 >= argc || !argv[i + 1]) {
            error = "Missing value for " + arg;
            return ParseStatus::Error;
        }
        const std::string value = argv[++i];

        if (arg == "--text") {
            const std::string text = Governor::trimLine(value);
            if (!text.empty()) opts.texts.push_back(text);
        } else if (arg == "--in") {
            opts.input_files.push_back(value);
        } else if (arg == "--out") {
            if (value.empty()) {
                error = "Invalid value for --out: (empty)";
                return ParseStatus::Error;
            }
            opts.out = value;
        } else if (!applyGovernorValue(arg, value, opts.governor)) {
            error = "Invalid value for " + arg + ": " + value;
            return ParseStatus::Error;
        }
    }

    out = opts;
    return ParseStatus::Ok;
}

void printUsage(std::ostream& os, const char* program) {
    const char* name = (program && *program) ? program : "onix_governor";
    os << "Usage: " << name << " [options] < input > accepted\n"
       << "  Reads lines from stdin, writes VERIFIED lines to stdout, verdicts to stderr.\n"
       << "\n";
    printGovernorFlags(os);
    os << "  --no-color          plain verdict tags on stderr\n"
       << "Presentation:\n"
       << "  --headless          no window\n"
       << "  --window <px>       window edge in pixels (default 600)\n"
       << "  --fps <v>           sampling rate limit (default 60)\n"
       << "  -h, --help          this text\n";
}

void printTraceUsage(std::ostream& os, const char* program) {
    const char* name = (program && *program) ? program : "onix_trace";
    os << "Usage: " << name << " (--text <s> | --in <file>)... [options] [--out file]\n"
       << "  Writes one CSV row per lattice step for every non-blank text.\n"
       << "\n"
       << "Input:\n"
       << "  --text <s>          text to trace (repeatable)\n"
       << "  --in <file>         one text per non-blank line (repeatable)\n"
       << "  --out <file>        CSV destination (default entropy_trace.csv)\n";
    printGovernorFlags(os);
    os << "  -h, --help          this text\n";
}

} // namespace onix
