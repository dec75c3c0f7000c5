#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "Governor.h"

namespace onix {

struct AppConfig {
    GovernorConfig governor{};
    bool headless = false;      // skip the presentation window entirely
    int window_px = 600;        // square window edge
    double fps_limit = 60.0;    // presentation sampling cadence
};

// onix_trace options. Texts are already trimmed; blank ones are dropped.
struct TraceOptions {
    GovernorConfig governor{};
    std::vector<std::string> texts{};
    std::vector<std::string> input_files{};
    std::string out = "entropy_trace.csv";
};

enum class ParseStatus : int {
    Ok    = 0,
    Help  = 1,
    Error = 2,
};

// Scans --flag value pairs into `out`. On Error, `error` names the offending argument.
// `out` keeps its defaults for any flag not given, and is untouched unless Ok.
ParseStatus parseCommandLine(int argc, const char* const* argv, AppConfig& out, std::string& error);

// Same lattice/decision flags and bounds as parseCommandLine, plus
// --text <s> (repeatable), --in <file> (repeatable) and --out <csv>.
ParseStatus parseTraceCommandLine(int argc, const char* const* argv, TraceOptions& out, std::string& error);

void printUsage(std::ostream& os, const char* program);
void printTraceUsage(std::ostream& os, const char* program);

} // namespace onix
