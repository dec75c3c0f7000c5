#pragma once

// world/ring_indicator.h
//
// Entropy ring: the visual signal drawn by the presentation window.
//
// Design goals:
//   - No GLFW / ImGui / ImPlot / OpenGL dependencies.
//   - Pure function of a sampled entropy value; holds no history.
//   - Rasterizes into a packed 0x00RRGGBB buffer, row 0 at the top.
//
// Mapping (surface pixels):
//   radius = base_radius + sin(entropy * pulse_freq) * pulse_amp
//   red    = entropy * 255
//   green  = (1 - entropy) * 200 + 55
//   blue   = 0
// Channels convert with saturating semantics; NaN maps to 0.

#include <cstdint>
#include <vector>

namespace onix {
namespace world {

struct RingIndicatorConfig {
    int width_px  = 600;
    int height_px = 600;

    double center_x_px = 300.0;
    double center_y_px = 300.0;

    double base_radius_px = 160.0;
    double pulse_amp_px   = 10.0;
    double pulse_freq     = 40.0;

    // 1200 samples at 0.3 degrees covers the full circle once.
    int num_points = 1200;
    double angle_step_deg = 0.3;

    std::uint32_t background_rgb = 0x050510u;
};

struct RingIndicatorState {
    double entropy = 0.0;
    double radius_px = 0.0;
    std::uint8_t red = 0;
    std::uint8_t green = 0;
    std::uint8_t blue = 0;

    std::uint32_t color_rgb() const {
        return (static_cast<std::uint32_t>(red) << 16) |
               (static_cast<std::uint32_t>(green) << 8) |
               static_cast<std::uint32_t>(blue);
    }
};

class RingIndicator {
public:
    RingIndicator() = default;
    explicit RingIndicator(const RingIndicatorConfig& cfg) : cfg_(cfg) {}

    void setConfig(const RingIndicatorConfig& cfg) { cfg_ = cfg; }
    const RingIndicatorConfig& config() const { return cfg_; }

    // Recompute colour and radius from an entropy sample.
    void recompute(double entropy);

    const RingIndicatorState& state() const { return state_; }

    // Fill `pixels` (resized to width*height) with background plus ring.
    void rasterize(std::vector<std::uint32_t>& pixels) const;

    // Saturating double -> byte, as a float-to-int cast that clamps (NaN -> 0).
    static std::uint8_t saturatingChannel(double v);

private:
    RingIndicatorConfig cfg_ {};
    RingIndicatorState state_ {};
};

} // namespace world
} // namespace onix
