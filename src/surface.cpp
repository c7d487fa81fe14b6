#include <rasterfx/surface.hpp>

#include <algorithm>
#include <cstring>
#include <new>

namespace rasterfx {

namespace {

// Largest allocation a decode may ask for
constexpr std::size_t MAX_PIXEL_BYTES = std::size_t{1} << 30;

} // namespace

bool pixel_buffer::set_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    // Both factors are positive ints, so checking against the cap before each
    // multiplication also rules out size_t overflow
    const auto row_bytes = static_cast<std::size_t>(width) * BYTES_PER_PIXEL;
    if (row_bytes > MAX_PIXEL_BYTES ||
        static_cast<std::size_t>(height) > MAX_PIXEL_BYTES / row_bytes) {
        return false;
    }

    try {
        pixels_.assign(row_bytes * static_cast<std::size_t>(height), 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    pitch_ = row_bytes;
    return true;
}

void pixel_buffer::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (pixels == nullptr || count <= 0 || x < 0 || y < 0 || y >= height_) {
        return;
    }

    const auto start = static_cast<std::size_t>(x);
    if (start >= pitch_) {
        return;
    }

    // Clip to the end of row y
    const std::size_t n = std::min(static_cast<std::size_t>(count), pitch_ - start);
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch_ + start, pixels, n);
}

rgba pixel_buffer::at(int x, int y) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return {};
    }

    const std::uint8_t* p = pixels_.data() + static_cast<std::size_t>(y) * pitch_ +
                            static_cast<std::size_t>(x) * BYTES_PER_PIXEL;
    return {p[0], p[1], p[2], p[3]};
}

void pixel_buffer::set(int x, int y, rgba color) noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return;
    }

    std::uint8_t* p = pixels_.data() + static_cast<std::size_t>(y) * pitch_ +
                      static_cast<std::size_t>(x) * BYTES_PER_PIXEL;
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    p[3] = color.a;
}

} // namespace rasterfx
