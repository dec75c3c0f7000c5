#pragma once

#include <atomic>
#include <cstdint>

namespace onix {

// Read-only view handed to observers (presentation, pollers).
struct EntropySample {
    double entropy = 0.0;
    std::uint64_t sequence = 0;        // number of publications so far
    std::uint64_t lines_verified = 0;
    std::uint64_t lines_blocked = 0;
    bool finished = false;
};

// Single-writer, many-reader entropy cell.
// The governor owns the lattice and publishes after every step; readers never
// touch the field, so no lock is shared between the two activities.
class EntropyProbe {
public:
    EntropyProbe() = default;

    EntropyProbe(const EntropyProbe&) = delete;
    EntropyProbe& operator=(const EntropyProbe&) = delete;

    void publish(double entropy) noexcept {
        entropy_.store(entropy, std::memory_order_relaxed);
        sequence_.fetch_add(1, std::memory_order_release);
    }

    void recordVerified() noexcept { verified_.fetch_add(1, std::memory_order_relaxed); }
    void recordBlocked() noexcept { blocked_.fetch_add(1, std::memory_order_relaxed); }

    void markFinished() noexcept { finished_.store(true, std::memory_order_release); }
    bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

    double entropy() const noexcept { return entropy_.load(std::memory_order_relaxed); }

    EntropySample sample() const noexcept {
        EntropySample s;
        s.sequence = sequence_.load(std::memory_order_acquire);
        s.entropy = entropy_.load(std::memory_order_relaxed);
        s.lines_verified = verified_.load(std::memory_order_relaxed);
        s.lines_blocked = blocked_.load(std::memory_order_relaxed);
        s.finished = finished_.load(std::memory_order_acquire);
        return s;
    }

private:
    std::atomic<double> entropy_{0.0};
    std::atomic<std::uint64_t> sequence_{0};
    std::atomic<std::uint64_t> verified_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<bool> finished_{false};
};

} // namespace onix
