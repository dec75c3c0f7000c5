#include "CommandLine.h"
#include "EntropyTrace.h"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {
bool readTexts(const std::string& path, std::vector<std::string>& texts) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        const std::string text = onix::Governor::trimLine(line);
        if (!text.empty()) {
            texts.push_back(text);
        }
    }
    return true;
}
} // namespace

int main(int argc, char** argv) {
    onix::TraceOptions opts;
    std::string error;

    const onix::ParseStatus status = onix::parseTraceCommandLine(argc, argv, opts, error);
    if (status == onix::ParseStatus::Help) {
        onix::printTraceUsage(std::cout, argv[0]);
        return 0;
    }
    if (status == onix::ParseStatus::Error) {
        std::cout << error << "\n";
        onix::printTraceUsage(std::cout, argv[0]);
        return 1;
    }

    std::vector<std::string> texts = opts.texts;
    for (const std::string& path : opts.input_files) {
        if (!readTexts(path, texts)) {
            std::cout << "Cannot read: " << path << "\n";
            return 1;
        }
    }

    if (texts.empty()) {
        std::cout << "No non-blank text to trace\n";
        onix::printTraceUsage(std::cout, argv[0]);
        return 1;
    }

    onix::EntropyTracer tracer;
    tracer.setConfig(opts.governor);

    for (std::size_t i = 0; i < texts.size(); ++i) {
        const std::string label = "line" + std::to_string(i + 1);
        const auto s = tracer.traceText(label, texts[i]);
        std::cout << label << ": " << onix::verdictName(s.verdict)
                  << " entropy " << onix::formatEntropy(s.final_entropy, 6);
        if (s.first_nonfinite_step > 0) {
            std::cout << " (non-finite from step " << s.first_nonfinite_step << ")";
        }
        std::cout << "\n";
    }

    if (!tracer.exportTraceCSV(opts.out)) {
        std::cout << "Cannot write: " << opts.out << "\n";
        return 1;
    }
    std::cout << "Wrote entropy trace to: " << opts.out << "\n";
    return 0;
}
