#include <rasterfx/filters.hpp>
#include <rasterfx/color.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace rasterfx {

namespace {

// Apply a per-pixel function to a copy of src. fn receives a pointer to the
// pixel's four bytes and must leave p[3] (alpha) alone.
template <typename Fn>
pixel_buffer map_pixels(const pixel_buffer& src, Fn fn) {
    pixel_buffer dst = src.clone();
    auto pixels = dst.mutable_pixels();
    for (std::size_t i = 0; i + BYTES_PER_PIXEL <= pixels.size(); i += BYTES_PER_PIXEL) {
        fn(pixels.data() + i);
    }
    return dst;
}

std::uint8_t clamp_channel(float v) noexcept {
    return static_cast<std::uint8_t>(std::clamp(v, 0.0f, 255.0f));
}

} // namespace

// ============================================================================
// Filter Names
// ============================================================================

const char* to_string(filter_kind kind) noexcept {
    switch (kind) {
        case filter_kind::grayscale:  return "grayscale";
        case filter_kind::blur:       return "blur";
        case filter_kind::hue_rotate: return "huerotate";
        case filter_kind::invert:     return "invert";
        case filter_kind::sepia:      return "sepia";
        case filter_kind::pixelate:   return "pixelate";
        case filter_kind::emboss:     return "emboss";
        case filter_kind::sharpen:    return "sharpen";
        case filter_kind::posterize:  return "posterize";
    }
    return "unknown";
}

std::optional<filter_kind> parse_filter_kind(std::string_view name) noexcept {
    for (const auto kind : all_filter_kinds) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Per-pixel Kernels
// ============================================================================

pixel_buffer grayscale(const pixel_buffer& src) {
    return map_pixels(src, [](std::uint8_t* p) {
        const std::uint8_t y = luma(p[0], p[1], p[2]);
        p[0] = y;
        p[1] = y;
        p[2] = y;
    });
}

pixel_buffer invert(const pixel_buffer& src) {
    return map_pixels(src, [](std::uint8_t* p) {
        p[0] = static_cast<std::uint8_t>(255 - p[0]);
        p[1] = static_cast<std::uint8_t>(255 - p[1]);
        p[2] = static_cast<std::uint8_t>(255 - p[2]);
    });
}

pixel_buffer sepia(const pixel_buffer& src) {
    return map_pixels(src, [](std::uint8_t* p) {
        const float r = p[0];
        const float g = p[1];
        const float b = p[2];
        p[0] = clamp_channel(0.393f * r + 0.769f * g + 0.189f * b);
        p[1] = clamp_channel(0.349f * r + 0.686f * g + 0.168f * b);
        p[2] = clamp_channel(0.272f * r + 0.534f * g + 0.131f * b);
    });
}

pixel_buffer hue_rotate(const pixel_buffer& src, int degrees) {
    const float shift = static_cast<float>(degrees % 360);
    return map_pixels(src, [shift](std::uint8_t* p) {
        hsl color = rgb_to_hsl({p[0], p[1], p[2], p[3]});
        // Gray pixels have no hue to rotate
        if (color.s == 0.0f) {
            return;
        }
        color.h += shift;
        const rgba out = hsl_to_rgb(color, p[3]);
        p[0] = out.r;
        p[1] = out.g;
        p[2] = out.b;
    });
}

pixel_buffer posterize(const pixel_buffer& src, int levels) {
    levels = std::clamp(levels, 2, 256);

    // levels equal-width floor buckets over [0,256), each mapped to a value
    // spread evenly over [0,255]
    std::uint8_t table[256];
    for (int v = 0; v < 256; ++v) {
        const int bucket = v * levels / 256;
        table[v] = static_cast<std::uint8_t>(bucket * 255 / (levels - 1));
    }

    return map_pixels(src, [&table](std::uint8_t* p) {
        p[0] = table[p[0]];
        p[1] = table[p[1]];
        p[2] = table[p[2]];
    });
}

// ============================================================================
// Block Kernels
// ============================================================================

pixel_buffer pixelate(const pixel_buffer& src, int block_size) {
    block_size = std::max(block_size, 1);

    pixel_buffer dst = src.clone();
    const int width = src.width();
    const int height = src.height();
    const auto in = src.pixels();
    auto out = dst.mutable_pixels();
    const std::size_t pitch = src.pitch();

    for (int by = 0; by < height; by += block_size) {
        const int y_end = std::min(by + block_size, height);
        for (int bx = 0; bx < width; bx += block_size) {
            const int x_end = std::min(bx + block_size, width);

            std::uint64_t sum[3] = {0, 0, 0};
            for (int y = by; y < y_end; ++y) {
                for (int x = bx; x < x_end; ++x) {
                    const std::size_t i = y * pitch + static_cast<std::size_t>(x) * BYTES_PER_PIXEL;
                    sum[0] += in[i + 0];
                    sum[1] += in[i + 1];
                    sum[2] += in[i + 2];
                }
            }

            const auto count = static_cast<std::uint64_t>(y_end - by) *
                               static_cast<std::uint64_t>(x_end - bx);
            const std::uint8_t mean[3] = {
                static_cast<std::uint8_t>((sum[0] + count / 2) / count),
                static_cast<std::uint8_t>((sum[1] + count / 2) / count),
                static_cast<std::uint8_t>((sum[2] + count / 2) / count),
            };

            for (int y = by; y < y_end; ++y) {
                for (int x = bx; x < x_end; ++x) {
                    const std::size_t i = y * pitch + static_cast<std::size_t>(x) * BYTES_PER_PIXEL;
                    out[i + 0] = mean[0];
                    out[i + 1] = mean[1];
                    out[i + 2] = mean[2];
                }
            }
        }
    }

    return dst;
}

// ============================================================================
// Dispatch
// ============================================================================

pixel_buffer apply(filter_kind kind, const pixel_buffer& src, const filter_options& options) {
    switch (kind) {
        case filter_kind::grayscale:  return grayscale(src);
        case filter_kind::blur:       return blur(src, options.blur_sigma);
        case filter_kind::hue_rotate: return hue_rotate(src, options.hue_rotate_degrees);
        case filter_kind::invert:     return invert(src);
        case filter_kind::sepia:      return sepia(src);
        case filter_kind::pixelate:   return pixelate(src, options.pixelate_block_size);
        case filter_kind::emboss:     return emboss(src, options.emboss_offset);
        case filter_kind::sharpen:    return sharpen(src);
        case filter_kind::posterize:  return posterize(src, options.posterize_levels);
    }
    return src.clone();
}

} // namespace rasterfx
