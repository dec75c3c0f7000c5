#include "Governor.h"

#include "EntropyProbe.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <istream>
#include <ostream>

namespace onix {

namespace {

constexpr const char* kAnsiRed   = "\x1b[91m";
constexpr const char* kAnsiGreen = "\x1b[92m";
constexpr const char* kAnsiReset = "\x1b[0m";

constexpr const char* kAsciiWhitespace = " \t\n\v\f\r";

// UTF-8 encodings of the non-ASCII Unicode White_Space code points.
constexpr const char* kUnicodeWhitespace[] = {
    "\xC2\x85",                                                     // U+0085
    "\xC2\xA0",                                                     // U+00A0
    "\xE1\x9A\x80",                                                 // U+1680
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", // U+2000..
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",                 // ..U+200A
    "\xE2\x80\xA8", "\xE2\x80\xA9",                                 // U+2028, U+2029
    "\xE2\x80\xAF",                                                 // U+202F
    "\xE2\x81\x9F",                                                 // U+205F
    "\xE3\x80\x80",                                                 // U+3000
};

// Byte length of the whitespace code point starting at `pos`, 0 if none.
static std::size_t whitespaceLengthAt(const std::string& s, std::size_t pos) {
    if (pos >= s.size()) return 0;
    if (s[pos] != '\0' && std::strchr(kAsciiWhitespace, s[pos]) != nullptr) return 1;
    for (const char* ws : kUnicodeWhitespace) {
        const std::size_t len = std::strlen(ws);
        if (pos + len <= s.size() && s.compare(pos, len, ws) == 0) return len;
    }
    return 0;
}

// Byte length of the whitespace code point ending at `end`, 0 if none.
static std::size_t whitespaceLengthBefore(const std::string& s, std::size_t end) {
    for (std::size_t len = 1; len <= 3 && len <= end; ++len) {
        if (whitespaceLengthAt(s, end - len) == len) return len;
    }
    return 0;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static GovernorConfig sanitize(GovernorConfig cfg) {
    if (cfg.steps < 0) cfg.steps = 0;
    return cfg;
}

} // namespace

std::string formatEntropy(double entropy, int precision) {
    if (std::isnan(entropy)) return "NaN";
    if (std::isinf(entropy)) return entropy > 0.0 ? "inf" : "-inf";

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, entropy);
    return buf;
}

std::string formatShortest(double value) {
    if (!std::isfinite(value)) return formatEntropy(value);

    // Fixed notation of a double needs at most ~330 characters.
    char buf[512];
    const std::to_chars_result res =
        std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (res.ec != std::errc()) {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
        return buf;
    }
    return std::string(buf, res.ptr);
}

const char* verdictName(Verdict v) {
    switch (v) {
        case Verdict::Verified: return "VERIFIED";
        case Verdict::Blocked:  return "BLOCKED";
        default: return "UNKNOWN";
    }
}

Governor::Governor(const GovernorConfig& cfg, EntropyProbe* probe)
    : cfg_(sanitize(cfg)),
      lattice_(cfg_.lattice),
      probe_(probe) {
    // Lattice may have sanitized N; keep the config in step with it.
    cfg_.lattice = lattice_.config();
}

Verdict Governor::classify(double entropy, double threshold, bool block_nonfinite) noexcept {
    if (block_nonfinite && !std::isfinite(entropy)) {
        return Verdict::Blocked;
    }
    return (entropy > threshold) ? Verdict::Blocked : Verdict::Verified;
}

std::string Governor::trimLine(const std::string& raw) {
    std::size_t first = 0;
    while (std::size_t len = whitespaceLengthAt(raw, first)) {
        first += len;
    }
    std::size_t end = raw.size();
    while (end > first) {
        const std::size_t len = whitespaceLengthBefore(raw, end);
        if (len == 0 || end - len < first) break;
        end -= len;
    }
    return raw.substr(first, end - first);
}

Decision Governor::evaluate(const std::string& text) {
    lattice_.inject(text);
    state_ = GovernorState::Injected;

    for (int k = 0; k < cfg_.steps; ++k) {
        state_ = GovernorState::Evolving;
        lattice_.step();
        if (probe_) probe_->publish(lattice_.entropy());
    }

    state_ = GovernorState::Scored;

    Decision d;
    d.entropy = lattice_.entropy();
    d.steps = cfg_.steps;
    d.bytes_injected = std::min(text.size(), lattice_.cellCount());
    d.verdict = classify(d.entropy, cfg_.threshold, cfg_.block_nonfinite);

    state_ = (d.verdict == Verdict::Blocked) ? GovernorState::Blocked : GovernorState::Verified;
    return d;
}

std::string Governor::formatLogLine(const Decision& d) const {
    const std::string value = formatEntropy(d.entropy, 3);
    std::string line;

    if (d.verdict == Verdict::Blocked) {
        line += cfg_.color_log ? std::string(kAnsiRed) + "BLOCKED" + kAnsiReset : std::string("BLOCKED");
        line += "   Hallucination \xE2\x80\x94 entropy " + value + " > " + formatShortest(cfg_.threshold);
    } else {
        line += cfg_.color_log ? std::string(kAnsiGreen) + "VERIFIED" + kAnsiReset : std::string("VERIFIED");
        line += "  Coherent \xE2\x80\x94 entropy " + value;
    }
    return line;
}

bool Governor::processLine(const std::string& raw, std::ostream& accepted, std::ostream& log) {
    state_ = GovernorState::Idle;
    ++stats_.lines_read;

    const std::string text = trimLine(raw);
    if (text.empty()) {
        ++stats_.blank_skipped;
        return false;
    }

    const Decision d = evaluate(text);
    log << formatLogLine(d) << '\n';

    if (d.verdict == Verdict::Blocked) {
        ++stats_.blocked;
        if (probe_) probe_->recordBlocked();
    } else {
        ++stats_.verified;
        if (probe_) probe_->recordVerified();
        accepted << text << '\n';
    }
    accepted.flush();
    return true;
}

GovernorStats Governor::run(std::istream& in, std::ostream& accepted, std::ostream& log) {
    std::string line;
    while (std::getline(in, line)) {
        processLine(line, accepted, log);
    }
    return stats_;
}

std::uint32_t Governor::paramHash() const {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, cfg_.lattice.size_n);
    h = fnv1a32_add_f64(h, cfg_.lattice.dt);
    h = fnv1a32_add_f64(h, cfg_.lattice.damping);
    h = fnv1a32_add_f64(h, cfg_.lattice.phase_twist);
    h = fnv1a32_add_f64(h, cfg_.lattice.nonlinear_coeff);
    h = fnv1a32_add_i32(h, cfg_.steps);
    h = fnv1a32_add_f64(h, cfg_.threshold);
    h = fnv1a32_add_i32(h, cfg_.block_nonfinite ? 1 : 0);
    return h;
}

} // namespace onix
