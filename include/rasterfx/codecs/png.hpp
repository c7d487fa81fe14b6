#ifndef RASTERFX_CODECS_PNG_HPP_
#define RASTERFX_CODECS_PNG_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace rasterfx {

// ============================================================================
// Input
// ============================================================================

/**
 * PNG input through lodepng. Every color type and bit depth (grey, palette,
 * RGB, with or without alpha, 16-bit) comes out as RGBA8888. The image size
 * is checked against decode_options from the IHDR chunk before any pixel
 * data is inflated.
 */
class RASTERFX_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};

    // 8-byte PNG signature
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// ============================================================================
// Output
// ============================================================================

/**
 * Encode a pixel buffer to PNG format.
 * @param buf Source buffer
 * @return Encode result holding the PNG stream on success
 */
[[nodiscard]] RASTERFX_EXPORT encode_result encode_png(const pixel_buffer& buf);

/**
 * Encode raw RGBA8888 memory to PNG format.
 * @param rgba Row-major pixel data, exactly width * height * 4 bytes
 * @param width Image width in pixels
 * @param height Image height in pixels
 * @return Encode result; size_mismatch if rgba has the wrong length
 */
[[nodiscard]] RASTERFX_EXPORT encode_result encode_png(std::span<const std::uint8_t> rgba,
                                                        int width, int height);

} // namespace rasterfx

#endif // RASTERFX_CODECS_PNG_HPP_
