#ifndef RASTERFX_FILTERS_HPP_
#define RASTERFX_FILTERS_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace rasterfx {

// ============================================================================
// Filter Kinds
// ============================================================================

enum class filter_kind {
    grayscale,
    blur,
    hue_rotate,
    invert,
    sepia,
    pixelate,
    emboss,
    sharpen,
    posterize
};

inline constexpr std::array<filter_kind, 9> all_filter_kinds = {
    filter_kind::grayscale,
    filter_kind::blur,
    filter_kind::hue_rotate,
    filter_kind::invert,
    filter_kind::sepia,
    filter_kind::pixelate,
    filter_kind::emboss,
    filter_kind::sharpen,
    filter_kind::posterize
};

/**
 * Name of a filter as accepted by parse_filter_kind() (e.g. "huerotate").
 */
[[nodiscard]] RASTERFX_EXPORT const char* to_string(filter_kind kind) noexcept;

/**
 * Look up a filter by name. Matching is exact and case-sensitive.
 * @return The filter kind, or std::nullopt for an unknown name
 */
[[nodiscard]] RASTERFX_EXPORT std::optional<filter_kind> parse_filter_kind(std::string_view name) noexcept;

// ============================================================================
// Filter Options
// ============================================================================

struct filter_options {
    float blur_sigma = 5.0f;        // Gaussian sigma, radius is ceil(3 * sigma)
    int hue_rotate_degrees = 90;    // any value, wrapped modulo 360
    int posterize_levels = 4;       // [2, 256]
    int pixelate_block_size = 8;    // >= 1
    int emboss_offset = 128;        // [0, 255]

    decode_options decode;
};

// ============================================================================
// Kernels
// ============================================================================
//
// Every kernel returns a new buffer with the source's dimensions and leaves
// the alpha channel unchanged. Out-of-range parameters are clamped to the
// nearest valid value; use validate() to reject them instead.

[[nodiscard]] RASTERFX_EXPORT pixel_buffer grayscale(const pixel_buffer& src);
[[nodiscard]] RASTERFX_EXPORT pixel_buffer invert(const pixel_buffer& src);
[[nodiscard]] RASTERFX_EXPORT pixel_buffer sepia(const pixel_buffer& src);
[[nodiscard]] RASTERFX_EXPORT pixel_buffer hue_rotate(const pixel_buffer& src, int degrees);

/**
 * Quantize R, G, B to `levels` evenly spaced values (0 and 255 included).
 * Floor bucketing: v falls in bucket v * levels / 256, which maps to
 * bucket * 255 / (levels - 1).
 */
[[nodiscard]] RASTERFX_EXPORT pixel_buffer posterize(const pixel_buffer& src, int levels);

/**
 * Replace R, G, B of every pixel with the rounded mean of its block.
 * Blocks are anchored at the top-left corner; partial blocks at the right and
 * bottom edges average only the pixels they contain.
 */
[[nodiscard]] RASTERFX_EXPORT pixel_buffer pixelate(const pixel_buffer& src, int block_size);

/**
 * Separable Gaussian blur with edge replication.
 */
[[nodiscard]] RASTERFX_EXPORT pixel_buffer blur(const pixel_buffer& src, float sigma);

[[nodiscard]] RASTERFX_EXPORT pixel_buffer sharpen(const pixel_buffer& src);

/**
 * Directional emboss (top-left negative, bottom-right positive) plus offset,
 * desaturated to luma. Flat regions come out as gray `offset`.
 */
[[nodiscard]] RASTERFX_EXPORT pixel_buffer emboss(const pixel_buffer& src, int offset);

/**
 * Run the kernel selected by `kind` with its parameters from `options`.
 */
[[nodiscard]] RASTERFX_EXPORT pixel_buffer apply(filter_kind kind,
                                                  const pixel_buffer& src,
                                                  const filter_options& options = {});

} // namespace rasterfx

#endif // RASTERFX_FILTERS_HPP_
