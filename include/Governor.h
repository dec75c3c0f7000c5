#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "Lattice.h"

namespace onix {

class EntropyProbe;

enum class Verdict : int {
    Verified = 0,
    Blocked  = 1,
};

// Per-line lifecycle. Blank lines never leave Idle.
enum class GovernorState : int {
    Idle     = 0,
    Injected = 1,
    Evolving = 2,
    Scored   = 3,
    Verified = 4,
    Blocked  = 5,
};

struct GovernorConfig {
    LatticeConfig lattice{};
    int steps = 70;                 // K, evolution steps per line
    double threshold = 0.618;       // entropy > threshold => Blocked
    bool block_nonfinite = false;   // off: NaN entropy compares false and passes
    bool color_log = true;          // ANSI tags on the status channel
};

struct Decision {
    Verdict verdict = Verdict::Verified;
    double entropy = 0.0;
    int steps = 0;
    std::size_t bytes_injected = 0;
};

struct GovernorStats {
    std::uint64_t lines_read = 0;
    std::uint64_t blank_skipped = 0;
    std::uint64_t verified = 0;
    std::uint64_t blocked = 0;
};

class Governor {
public:
    explicit Governor(const GovernorConfig& cfg, EntropyProbe* probe = nullptr);

    // Owns the lattice; keep a single instance per pipeline.
    Governor(const Governor&) = delete;
    Governor& operator=(const Governor&) = delete;

    // Strict '>' : entropy equal to the threshold is Verified.
    static Verdict classify(double entropy, double threshold, bool block_nonfinite = false) noexcept;

    // Strips leading/trailing Unicode White_Space (ASCII set plus the UTF-8 encoded
    // U+0085, U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000).
    // Other bytes, including invalid UTF-8, are kept as-is.
    static std::string trimLine(const std::string& raw);

    // inject + K steps + score. Publishes every intermediate entropy to the probe.
    Decision evaluate(const std::string& text);

    // One raw input line. Returns false (and touches nothing) for blank lines.
    // Verified text goes to `accepted`, the status line to `log`.
    bool processLine(const std::string& raw, std::ostream& accepted, std::ostream& log);

    // Consumes `in` until EOF.
    GovernorStats run(std::istream& in, std::ostream& accepted, std::ostream& log);

    std::string formatLogLine(const Decision& d) const;

    // FNV-1a 32 over the effective parameters (lattice + K + threshold).
    std::uint32_t paramHash() const;

    GovernorState state() const noexcept { return state_; }
    const GovernorStats& stats() const noexcept { return stats_; }
    const GovernorConfig& config() const noexcept { return cfg_; }
    const ResonantLattice& lattice() const noexcept { return lattice_; }

private:
    GovernorConfig cfg_{};
    ResonantLattice lattice_;
    EntropyProbe* probe_ = nullptr;
    GovernorState state_ = GovernorState::Idle;
    GovernorStats stats_{};
};

// "NaN" / "inf" / "-inf" for non-finite values, otherwise printf-style with `precision` decimals.
std::string formatEntropy(double entropy, int precision = 3);

// Shortest fixed-notation text that parses back to the same double ("0.618", "1").
std::string formatShortest(double value);

const char* verdictName(Verdict v);

} // namespace onix
