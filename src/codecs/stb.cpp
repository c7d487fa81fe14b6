#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_PNG  // lodepng owns PNG
#define STBI_NO_PSD
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM
#define STBI_NO_STDIO

#include <stb_image.h>

#include <rasterfx/codecs/stb.hpp>
#include "endian.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>

namespace rasterfx {

namespace {

using stb_pixels = std::unique_ptr<stbi_uc, decltype(&stbi_image_free)>;

decode_result load_with_stb(std::span<const std::uint8_t> data,
                            surface& surf,
                            const decode_options& options) {
    // stb takes the length as int
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Input is larger than 2 GiB");
    }
    const auto* bytes = data.data();
    const auto length = static_cast<int>(data.size());

    // Size check from the header alone; skipped when stb cannot parse it, in which
    // case the full load below reports the reason
    int width = 0;
    int height = 0;
    int channels = 0;
    if (stbi_info_from_memory(bytes, length, &width, &height, &channels)) {
        auto limits = validate_dimensions(width, height, options);
        if (!limits) return limits;
    }

    stb_pixels pixels(stbi_load_from_memory(bytes, length, &width, &height, &channels, 4),
                      stbi_image_free);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        return decode_result::failure(decode_error::invalid_format,
            reason ? reason : "corrupt image data");
    }

    auto limits = validate_dimensions(width, height, options);
    if (!limits) return limits;

    return write_rgba(surf, pixels.get(), width, height);
}

template <typename Codec>
decode_result decode_as(std::span<const std::uint8_t> data,
                        surface& surf,
                        const decode_options& options) {
    if (!Codec::sniff(data)) {
        return decode_result::failure(decode_error::invalid_format,
            "Data is not " + std::string(Codec::name));
    }
    auto result = load_with_stb(data, surf, options);
    if (!result && result.error == decode_error::invalid_format) {
        result.message = std::string(Codec::name) + ": " + result.message;
    }
    return result;
}

bool starts_with(std::span<const std::uint8_t> data,
                 std::initializer_list<std::uint8_t> magic) noexcept {
    return data.size() >= magic.size() && std::equal(magic.begin(), magic.end(), data.begin());
}

constexpr std::size_t BMP_FILE_HEADER_SIZE = 14;
constexpr std::array<std::uint32_t, 6> BMP_DIB_HEADER_SIZES = {
    12,   // BITMAPCOREHEADER
    40,   // BITMAPINFOHEADER
    52,   // BITMAPV2INFOHEADER
    56,   // BITMAPV3INFOHEADER
    108,  // BITMAPV4HEADER
    124,  // BITMAPV5HEADER
};

// TGA header byte offsets
constexpr std::size_t TGA_HEADER_SIZE = 18;
constexpr std::size_t TGA_COLORMAP_TYPE = 1;
constexpr std::size_t TGA_IMAGE_TYPE = 2;
constexpr std::size_t TGA_WIDTH = 12;
constexpr std::size_t TGA_HEIGHT = 14;
constexpr std::size_t TGA_DEPTH = 16;
constexpr int TGA_MAX_DIMENSION = 32768;

} // namespace

// ============================================================================
// Signature checks
// ============================================================================

bool jpeg_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return starts_with(data, {0xFF, 0xD8, 0xFF});
}

bool gif_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return starts_with(data, {'G', 'I', 'F', '8', '7', 'a'}) ||
           starts_with(data, {'G', 'I', 'F', '8', '9', 'a'});
}

bool bmp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < BMP_FILE_HEADER_SIZE + 4 || !starts_with(data, {'B', 'M'})) {
        return false;
    }
    const std::uint32_t dib_size = load_le<std::uint32_t>(data.data() + BMP_FILE_HEADER_SIZE);
    return std::find(BMP_DIB_HEADER_SIZES.begin(), BMP_DIB_HEADER_SIZES.end(), dib_size) !=
           BMP_DIB_HEADER_SIZES.end();
}

bool tga_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < TGA_HEADER_SIZE) {
        return false;
    }

    // 1-3 raw, 9-11 RLE; 0 carries no pixels
    const std::uint8_t type = data[TGA_IMAGE_TYPE];
    const bool raw = type >= 1 && type <= 3;
    const bool rle = type >= 9 && type <= 11;
    if (!raw && !rle) {
        return false;
    }
    if (data[TGA_COLORMAP_TYPE] > 1) {
        return false;
    }

    switch (data[TGA_DEPTH]) {
        case 8: case 15: case 16: case 24: case 32:
            break;
        default:
            return false;
    }

    const int width = load_le<std::uint16_t>(data.data() + TGA_WIDTH);
    const int height = load_le<std::uint16_t>(data.data() + TGA_HEIGHT);
    return width > 0 && height > 0 && width <= TGA_MAX_DIMENSION && height <= TGA_MAX_DIMENSION;
}

// ============================================================================
// Decode
// ============================================================================

decode_result jpeg_decoder::decode(std::span<const std::uint8_t> data,
                                    surface& surf,
                                    const decode_options& options) {
    return decode_as<jpeg_decoder>(data, surf, options);
}

decode_result gif_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    return decode_as<gif_decoder>(data, surf, options);
}

decode_result bmp_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    return decode_as<bmp_decoder>(data, surf, options);
}

decode_result tga_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    return decode_as<tga_decoder>(data, surf, options);
}

} // namespace rasterfx
