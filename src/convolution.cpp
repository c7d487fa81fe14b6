#include <rasterfx/filters.hpp>
#include <rasterfx/color.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

// Spatial kernels. Each one reads only from `src` and writes only to a
// separate destination buffer, so no output pixel ever feeds another's input.

namespace rasterfx {

namespace {

constexpr float MAX_BLUR_SIGMA = 64.0f;

// Row-major 3x3 weights, top-left first
using kernel3x3 = std::array<int, 9>;

constexpr kernel3x3 SHARPEN_KERNEL = {
     0, -1,  0,
    -1,  5, -1,
     0, -1,  0
};

constexpr kernel3x3 EMBOSS_KERNEL = {
    -1, -1,  0,
    -1,  0,  1,
     0,  1,  1
};

inline std::size_t offset_of(int x, int y, std::size_t pitch) noexcept {
    return static_cast<std::size_t>(y) * pitch + static_cast<std::size_t>(x) * BYTES_PER_PIXEL;
}

// Convolve R, G, B with edge replication; alpha is copied from src.
pixel_buffer convolve3x3(const pixel_buffer& src, const kernel3x3& kernel, int offset) {
    pixel_buffer dst = src.clone();
    const int width = src.width();
    const int height = src.height();
    const std::size_t pitch = src.pitch();
    const auto in = src.pixels();
    auto out = dst.mutable_pixels();

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            int acc[3] = {0, 0, 0};
            for (int ky = 0; ky < 3; ++ky) {
                const int sy = std::clamp(y + ky - 1, 0, height - 1);
                for (int kx = 0; kx < 3; ++kx) {
                    const int weight = kernel[static_cast<std::size_t>(ky * 3 + kx)];
                    if (weight == 0) {
                        continue;
                    }
                    const int sx = std::clamp(x + kx - 1, 0, width - 1);
                    const std::size_t i = offset_of(sx, sy, pitch);
                    acc[0] += weight * in[i + 0];
                    acc[1] += weight * in[i + 1];
                    acc[2] += weight * in[i + 2];
                }
            }

            const std::size_t o = offset_of(x, y, pitch);
            out[o + 0] = static_cast<std::uint8_t>(std::clamp(acc[0] + offset, 0, 255));
            out[o + 1] = static_cast<std::uint8_t>(std::clamp(acc[1] + offset, 0, 255));
            out[o + 2] = static_cast<std::uint8_t>(std::clamp(acc[2] + offset, 0, 255));
        }
    }

    return dst;
}

// Normalized 1D Gaussian, radius ceil(3 * sigma)
std::vector<float> gaussian_kernel(float sigma) {
    const int radius = std::max(1, static_cast<int>(std::ceil(3.0f * sigma)));
    std::vector<float> kernel(static_cast<std::size_t>(2 * radius + 1));

    const float denom = 2.0f * sigma * sigma;
    float sum = 0.0f;
    for (int i = -radius; i <= radius; ++i) {
        const float w = std::exp(-static_cast<float>(i * i) / denom);
        kernel[static_cast<std::size_t>(i + radius)] = w;
        sum += w;
    }
    for (auto& w : kernel) {
        w /= sum;
    }
    return kernel;
}

} // namespace

pixel_buffer blur(const pixel_buffer& src, float sigma) {
    if (!(sigma > 0.0f) || src.empty()) {
        return src.clone();
    }
    sigma = std::min(sigma, MAX_BLUR_SIGMA);

    const auto kernel = gaussian_kernel(sigma);
    const int radius = static_cast<int>(kernel.size() / 2);
    const int width = src.width();
    const int height = src.height();
    const std::size_t pitch = src.pitch();
    const auto in = src.pixels();

    // Horizontal pass into a float RGB buffer
    const std::size_t row_floats = static_cast<std::size_t>(width) * 3;
    std::vector<float> tmp(row_floats * static_cast<std::size_t>(height), 0.0f);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc[3] = {0.0f, 0.0f, 0.0f};
            for (int k = -radius; k <= radius; ++k) {
                const int sx = std::clamp(x + k, 0, width - 1);
                const float w = kernel[static_cast<std::size_t>(k + radius)];
                const std::size_t i = offset_of(sx, y, pitch);
                acc[0] += w * in[i + 0];
                acc[1] += w * in[i + 1];
                acc[2] += w * in[i + 2];
            }
            float* t = tmp.data() + static_cast<std::size_t>(y) * row_floats +
                       static_cast<std::size_t>(x) * 3;
            t[0] = acc[0];
            t[1] = acc[1];
            t[2] = acc[2];
        }
    }

    // Vertical pass into the destination
    pixel_buffer dst = src.clone();
    auto out = dst.mutable_pixels();
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc[3] = {0.0f, 0.0f, 0.0f};
            for (int k = -radius; k <= radius; ++k) {
                const int sy = std::clamp(y + k, 0, height - 1);
                const float w = kernel[static_cast<std::size_t>(k + radius)];
                const float* t = tmp.data() + static_cast<std::size_t>(sy) * row_floats +
                                 static_cast<std::size_t>(x) * 3;
                acc[0] += w * t[0];
                acc[1] += w * t[1];
                acc[2] += w * t[2];
            }
            const std::size_t o = offset_of(x, y, pitch);
            for (int c = 0; c < 3; ++c) {
                out[o + static_cast<std::size_t>(c)] =
                    static_cast<std::uint8_t>(std::clamp(std::round(acc[c]), 0.0f, 255.0f));
            }
        }
    }

    return dst;
}

pixel_buffer sharpen(const pixel_buffer& src) {
    return convolve3x3(src, SHARPEN_KERNEL, 0);
}

pixel_buffer emboss(const pixel_buffer& src, int offset) {
    pixel_buffer dst = convolve3x3(src, EMBOSS_KERNEL, std::clamp(offset, 0, 255));

    auto out = dst.mutable_pixels();
    for (std::size_t i = 0; i + BYTES_PER_PIXEL <= out.size(); i += BYTES_PER_PIXEL) {
        const std::uint8_t y = luma(out[i + 0], out[i + 1], out[i + 2]);
        out[i + 0] = y;
        out[i + 1] = y;
        out[i + 2] = y;
    }
    return dst;
}

} // namespace rasterfx
