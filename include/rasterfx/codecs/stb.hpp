#ifndef RASTERFX_CODECS_STB_HPP_
#define RASTERFX_CODECS_STB_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

// Formats read through stb_image. Each decode() checks sniff() first, then
// rejects oversized images from the header before any pixel is decoded.
// Grey, grey+alpha and RGB sources are expanded to RGBA with alpha 255.

namespace rasterfx {

// Baseline and progressive JPEG (FF D8 FF)
class RASTERFX_EXPORT jpeg_decoder {
public:
    static constexpr std::string_view name = "jpeg";
    static constexpr std::string_view extensions[] = {".jpg", ".jpeg", ".jpe", ".jfif"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// GIF87a / GIF89a. Animations yield their first frame only.
class RASTERFX_EXPORT gif_decoder {
public:
    static constexpr std::string_view name = "gif";
    static constexpr std::string_view extensions[] = {".gif"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// Windows bitmap: "BM" followed by a core, info or V2-V5 DIB header
class RASTERFX_EXPORT bmp_decoder {
public:
    static constexpr std::string_view name = "bmp";
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

/**
 * Truevision TGA, color-mapped, truecolor or grey, raw or RLE.
 * There is no magic number: sniff() accepts any 18-byte header whose image
 * type, color map type, depth and dimensions are all plausible, so it can
 * match stray data that no other format claimed.
 */
class RASTERFX_EXPORT tga_decoder {
public:
    static constexpr std::string_view name = "tga";
    static constexpr std::string_view extensions[] = {".tga", ".targa"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

} // namespace rasterfx

#endif // RASTERFX_CODECS_STB_HPP_
