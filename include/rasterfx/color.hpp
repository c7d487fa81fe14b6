#ifndef RASTERFX_COLOR_HPP_
#define RASTERFX_COLOR_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>

#include <cstdint>

namespace rasterfx {

// ============================================================================
// HSL Color Space
// ============================================================================

struct hsl {
    float h = 0.0f;  // degrees, [0, 360)
    float s = 0.0f;  // [0, 1]
    float l = 0.0f;  // [0, 1]
};

/**
 * Convert the RGB part of a pixel to HSL. Alpha is ignored.
 * Achromatic colors (r == g == b) report h = 0, s = 0.
 */
[[nodiscard]] RASTERFX_EXPORT hsl rgb_to_hsl(rgba color) noexcept;

/**
 * Convert HSL back to RGB, rounding each channel to the nearest integer.
 * Hue outside [0, 360) is wrapped; s and l are clamped to [0, 1].
 * @param color HSL triple
 * @param alpha Alpha value to attach to the result
 */
[[nodiscard]] RASTERFX_EXPORT rgba hsl_to_rgb(hsl color, std::uint8_t alpha = 255) noexcept;

// ============================================================================
// Luminance
// ============================================================================

/**
 * Rec. 709 luma in integer arithmetic: (2126 R + 7152 G + 722 B) / 10000.
 * Weights sum to 10000, so luma(v, v, v) == v.
 */
[[nodiscard]] constexpr std::uint8_t luma(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
    const std::uint32_t sum = 2126u * r + 7152u * g + 722u * b;
    return static_cast<std::uint8_t>(sum / 10000u);
}

} // namespace rasterfx

#endif // RASTERFX_COLOR_HPP_
