#include "Lattice.h"

#include <algorithm>
#include <cmath>

namespace onix {

namespace {

constexpr double kByteScale = 255.0;

// d * i as the plain textbook product. std::complex operator* recovers
// infinities (C99 Annex G); here inf*0 must still give NaN.
static inline ResonantLattice::Amplitude timesI(const ResonantLattice::Amplitude& d) {
    return ResonantLattice::Amplitude(d.real() * 0.0 - d.imag() * 1.0,
                                      d.real() * 1.0 + d.imag() * 0.0);
}

static LatticeConfig sanitize(LatticeConfig cfg) {
    if (cfg.size_n < 1) cfg.size_n = 1;
    return cfg;
}

} // namespace

ResonantLattice::ResonantLattice() : ResonantLattice(LatticeConfig{}) {}

ResonantLattice::ResonantLattice(const LatticeConfig& cfg)
    : cfg_(sanitize(cfg)) {
    const std::size_t n = static_cast<std::size_t>(cfg_.size_n);
    psi_.assign(n * n, Amplitude(0.0, 0.0));
    next_.assign(n * n, Amplitude(0.0, 0.0));
}

void ResonantLattice::inject(const std::string& text) {
    std::fill(psi_.begin(), psi_.end(), Amplitude(0.0, 0.0));

    const std::size_t count = std::min(text.size(), psi_.size());
    for (std::size_t i = 0; i < count; ++i) {
        const double v = static_cast<double>(static_cast<unsigned char>(text[i])) / kByteScale;
        psi_[i] = Amplitude(v, v * cfg_.phase_twist);
    }
    steps_since_inject_ = 0;
}

std::size_t ResonantLattice::neighborIndex(std::size_t i, std::ptrdiff_t offset) const {
    const std::ptrdiff_t size = static_cast<std::ptrdiff_t>(psi_.size());
    std::ptrdiff_t r = (static_cast<std::ptrdiff_t>(i) + offset) % size;
    if (r < 0) r += size;
    return static_cast<std::size_t>(r);
}

void ResonantLattice::step() {
    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(cfg_.size_n);
    const std::size_t cells = psi_.size();
    double dissonance = 0.0;

    for (std::size_t i = 0; i < cells; ++i) {
        const Amplitude& self = psi_[i];
        const Amplitude& up    = psi_[neighborIndex(i, -n)];
        const Amplitude& down  = psi_[neighborIndex(i,  n)];
        const Amplitude& left  = psi_[neighborIndex(i, -1)];
        const Amplitude& right = psi_[neighborIndex(i,  1)];

        const Amplitude laplacian = up + down + left + right - 4.0 * self;
        const double mag = std::abs(self);
        const Amplitude nonlinear = self * (1.0 + cfg_.nonlinear_coeff * (mag * mag));

        Amplitude next = self;
        next += timesI(laplacian - nonlinear) * cfg_.dt;
        next *= cfg_.damping;
        next_[i] = next;

        dissonance += std::abs(next.imag());
    }

    psi_.swap(next_);
    // std::clamp keeps NaN as NaN; overflow is not guarded here.
    entropy_ = std::clamp(dissonance / static_cast<double>(cfg_.size_n), 0.0, 1.0);
    ++steps_since_inject_;
}

double ResonantLattice::peakMagnitude() const {
    double peak = 0.0;
    for (const Amplitude& a : psi_) {
        const double m = std::abs(a);
        if (std::isnan(m)) return m;
        peak = std::max(peak, m);
    }
    return peak;
}

} // namespace onix
