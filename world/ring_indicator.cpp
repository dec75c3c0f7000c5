// world/ring_indicator.cpp
//
// Implementation notes:
//   - Points are truncated toward zero, then clipped to the surface.
//   - Each ring point also lights its right and lower neighbour (glow),
//     bounded by the buffer length only, so the right glow of the last
//     column lands on the next row.

#include "ring_indicator.h"

#include <cmath>
#include <cstddef>

namespace onix {
namespace world {

static constexpr double kPi = 3.14159265358979323846;

std::uint8_t RingIndicator::saturatingChannel(double v) {
    if (!(v > 0.0)) return 0;          // also catches NaN
    if (v >= 255.0) return 255;
    return static_cast<std::uint8_t>(v);
}

void RingIndicator::recompute(double entropy) {
    state_.entropy = entropy;

    double radius = cfg_.base_radius_px + std::sin(entropy * cfg_.pulse_freq) * cfg_.pulse_amp_px;
    if (!std::isfinite(radius)) {
        radius = cfg_.base_radius_px;
    }
    state_.radius_px = radius;

    state_.red   = saturatingChannel(entropy * 255.0);
    state_.green = saturatingChannel((1.0 - entropy) * 200.0 + 55.0);
    state_.blue  = 0;
}

void RingIndicator::rasterize(std::vector<std::uint32_t>& pixels) const {
    const int w = (cfg_.width_px > 0) ? cfg_.width_px : 0;
    const int h = (cfg_.height_px > 0) ? cfg_.height_px : 0;
    const std::size_t count = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);

    pixels.assign(count, cfg_.background_rgb);
    if (count == 0) return;

    const std::uint32_t color = state_.color_rgb();
    const std::size_t stride = static_cast<std::size_t>(w);

    for (int a = 0; a < cfg_.num_points; ++a) {
        const double rad = (static_cast<double>(a) * cfg_.angle_step_deg) * kPi / 180.0;
        const double xf = cfg_.center_x_px + state_.radius_px * std::cos(rad);
        const double yf = cfg_.center_y_px + state_.radius_px * std::sin(rad);

        if (!(xf > -1.0) || !(yf > -1.0)) continue;
        const long xi = static_cast<long>(xf);
        const long yi = static_cast<long>(yf);
        if (xi >= w || yi >= h) continue;

        const std::size_t idx = static_cast<std::size_t>(yi) * stride + static_cast<std::size_t>(xi);
        pixels[idx] = color;
        if (idx + 1 < count) pixels[idx + 1] = color;
        if (idx + stride < count) pixels[idx + stride] = color;
    }
}

} // namespace world
} // namespace onix
