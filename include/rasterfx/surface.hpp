#ifndef RASTERFX_SURFACE_HPP_
#define RASTERFX_SURFACE_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rasterfx {

// ============================================================================
// Decode Target
// ============================================================================

/**
 * Where a decoder puts its output. Decoders call set_size() once and then
 * hand over RGBA8888 data row by row.
 */
class RASTERFX_EXPORT surface {
public:
    virtual ~surface() = default;

    // Returns false if storage for width x height pixels cannot be had
    virtual bool set_size(int width, int height) = 0;

    /**
     * Copy `count` bytes into row `y`, starting `x` bytes (not pixels) into
     * the row. Bytes falling outside the row are dropped.
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// Pixel Buffer
// ============================================================================

/**
 * In-memory RGBA8888 image, row-major, top-to-bottom.
 * pixels().size() == width() * height() * 4 whenever the buffer is non-empty.
 */
class RASTERFX_EXPORT pixel_buffer : public surface {
public:
    pixel_buffer() = default;
    ~pixel_buffer() override = default;

    pixel_buffer& operator=(const pixel_buffer&) = delete;
    pixel_buffer(pixel_buffer&&) noexcept = default;
    pixel_buffer& operator=(pixel_buffer&&) noexcept = default;

    bool set_size(int width, int height) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    /**
     * Deep copy. Copying is explicit so that kernels never alias buffers by accident.
     */
    [[nodiscard]] pixel_buffer clone() const { return pixel_buffer(*this); }

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

    // Kernels write their destination through this
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    // Single pixel access; out-of-range reads return transparent black,
    // out-of-range writes are ignored.
    [[nodiscard]] rgba at(int x, int y) const noexcept;
    void set(int x, int y, rgba color) noexcept;

private:
    pixel_buffer(const pixel_buffer&) = default;

    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
};

} // namespace rasterfx

#endif // RASTERFX_SURFACE_HPP_
