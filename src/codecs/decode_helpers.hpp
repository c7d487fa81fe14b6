#pragma once

#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>

#include <cstdint>
#include <cstddef>
#include <utility>

namespace rasterfx {

// Default dimension limit
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options) {
    int max_w = options.max_width > 0 ? options.max_width : DEFAULT_MAX_DIMENSION;
    int max_h = options.max_height > 0 ? options.max_height : DEFAULT_MAX_DIMENSION;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
// or if either dimension is zero. Returns success() otherwise.
inline decode_result validate_dimensions(int width, int height,
                                          const decode_options& options) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::invalid_format,
            "Image has zero width or height");
    }
    auto [max_w, max_h] = get_dimension_limits(options);
    if (width > max_w || height > max_h) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions exceed limits");
    }
    return decode_result::success();
}

// Allocate the surface and copy RGBA8888 rows into it
// data: pointer to pixel data (row-major, contiguous, width * 4 bytes per row)
inline decode_result write_rgba(surface& surf, const std::uint8_t* data,
                                int width, int height) {
    if (!surf.set_size(width, height)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    const std::size_t row_bytes = static_cast<std::size_t>(width) * BYTES_PER_PIXEL;
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * row_bytes);
    }
    return decode_result::success();
}

} // namespace rasterfx
