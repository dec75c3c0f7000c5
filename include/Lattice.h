#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace onix {

// ============================================================
// Resonant lattice: N x N complex field, flattened row-major.
//
// Invariants:
// - Cell count is fixed at construction (N*N).
// - Neighbour lookups wrap on the flattened index (Euclidean remainder),
//   not per row/column. Entropy values depend on this; keep it.
// - step() is a synchronous update: every next value is computed from
//   the field as it was at the start of the step.
// ============================================================

struct LatticeConfig {
    int size_n = 80;              // N (grid is N x N)
    double dt = 0.108;            // time step
    double damping = 0.991;       // applied to every cell after each update
    double phase_twist = 0.61;    // injected imaginary part = phase_twist * real part
    double nonlinear_coeff = 0.618;
};

class ResonantLattice {
public:
    using Amplitude = std::complex<double>;

    ResonantLattice();
    explicit ResonantLattice(const LatticeConfig& cfg);

    // Clears the field, then seeds cell i from byte i of text.
    // Bytes beyond N*N are ignored. Entropy is left as-is until the next step().
    void inject(const std::string& text);

    void step();

    // Mean absolute imaginary part (sum / N) after the last step, clamped to [0,1].
    // NaN is passed through unchanged.
    double entropy() const noexcept { return entropy_; }

    const std::vector<Amplitude>& field() const { return psi_; }
    const LatticeConfig& config() const { return cfg_; }

    int sizeN() const noexcept { return cfg_.size_n; }
    std::size_t cellCount() const noexcept { return psi_.size(); }

    // Steps taken since the last inject() (or construction).
    std::uint64_t stepsSinceInject() const noexcept { return steps_since_inject_; }

    // Flattened neighbour index: (i + offset) mod N*N, always non-negative.
    std::size_t neighborIndex(std::size_t i, std::ptrdiff_t offset) const;

    // Largest |psi| over the field (diagnostic only, never feeds the update rule).
    double peakMagnitude() const;

private:
    LatticeConfig cfg_{};
    std::vector<Amplitude> psi_;
    std::vector<Amplitude> next_;
    double entropy_ = 0.0;
    std::uint64_t steps_since_inject_ = 0;
};

} // namespace onix
