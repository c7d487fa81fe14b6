#include <rasterfx/color.hpp>

#include <algorithm>
#include <cmath>

namespace rasterfx {

namespace {

float hue_to_channel(float p, float q, float t) noexcept {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

std::uint8_t to_byte(float v) noexcept {
    return static_cast<std::uint8_t>(std::clamp(std::round(v * 255.0f), 0.0f, 255.0f));
}

} // namespace

hsl rgb_to_hsl(rgba color) noexcept {
    const float r = color.r / 255.0f;
    const float g = color.g / 255.0f;
    const float b = color.b / 255.0f;

    const float max = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float l = (max + min) / 2.0f;

    if (color.r == color.g && color.g == color.b) {
        return {0.0f, 0.0f, l};
    }

    const float d = max - min;
    const float s = l > 0.5f ? d / (2.0f - max - min) : d / (max + min);

    float h = 0.0f;
    if (max == r) {
        h = (g - b) / d + (g < b ? 6.0f : 0.0f);
    } else if (max == g) {
        h = (b - r) / d + 2.0f;
    } else {
        h = (r - g) / d + 4.0f;
    }
    h *= 60.0f;
    if (h >= 360.0f) h -= 360.0f;

    return {h, s, l};
}

rgba hsl_to_rgb(hsl color, std::uint8_t alpha) noexcept {
    float h = std::fmod(color.h, 360.0f);
    if (h < 0.0f) h += 360.0f;
    const float s = std::clamp(color.s, 0.0f, 1.0f);
    const float l = std::clamp(color.l, 0.0f, 1.0f);

    if (s == 0.0f) {
        const std::uint8_t v = to_byte(l);
        return {v, v, v, alpha};
    }

    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;
    const float t = h / 360.0f;

    return {to_byte(hue_to_channel(p, q, t + 1.0f / 3.0f)),
            to_byte(hue_to_channel(p, q, t)),
            to_byte(hue_to_channel(p, q, t - 1.0f / 3.0f)),
            alpha};
}

} // namespace rasterfx
