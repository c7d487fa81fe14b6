#include <rasterfx/codecs/png.hpp>
#include "endian.hpp"
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <algorithm>
#include <array>
#include <limits>
#include <string>

namespace rasterfx {

namespace {

constexpr std::array<std::uint8_t, 8> PNG_SIGNATURE = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

// The first chunk must be IHDR: length(4) "IHDR"(4) width(4) height(4) ...
constexpr std::size_t IHDR_OFFSET = PNG_SIGNATURE.size();
constexpr std::uint32_t IHDR_DATA_LENGTH = 13;
constexpr std::uint32_t IHDR_TAG = 0x49484452;
constexpr std::size_t IHDR_SIZE_END = IHDR_OFFSET + 16;

constexpr auto MAX_INT = static_cast<std::uint32_t>(std::numeric_limits<int>::max());

// Reject by declared size before lodepng allocates anything. A malformed IHDR
// is left for lodepng to report.
decode_result check_declared_size(std::span<const std::uint8_t> data,
                                  const decode_options& options) {
    const std::uint8_t* ihdr = data.data() + IHDR_OFFSET;
    if (load_be<std::uint32_t>(ihdr) != IHDR_DATA_LENGTH ||
        load_be<std::uint32_t>(ihdr + 4) != IHDR_TAG) {
        return decode_result::success();
    }
    const std::uint32_t width = load_be<std::uint32_t>(ihdr + 8);
    const std::uint32_t height = load_be<std::uint32_t>(ihdr + 12);
    if (width > MAX_INT || height > MAX_INT) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG declares " + std::to_string(width) + "x" + std::to_string(height));
    }
    return validate_dimensions(static_cast<int>(width), static_cast<int>(height), options);
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= PNG_SIGNATURE.size() &&
           std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), data.begin());
}

decode_result png_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Data is not png");
    }
    if (data.size() < IHDR_SIZE_END) {
        return decode_result::failure(decode_error::truncated_data,
            "PNG ends before the image size");
    }

    auto declared = check_declared_size(data, options);
    if (!declared) return declared;

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> rgba;
    // Any color type and bit depth comes back as RGBA8
    const unsigned error = lodepng::decode(rgba, width, height, data.data(), data.size(),
                                           LCT_RGBA, 8);
    if (error != 0) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("png: ") + lodepng_error_text(error));
    }

    // lodepng may have accepted an IHDR the pre-check skipped
    if (width > MAX_INT || height > MAX_INT) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG is " + std::to_string(width) + "x" + std::to_string(height));
    }
    auto decoded = validate_dimensions(static_cast<int>(width), static_cast<int>(height), options);
    if (!decoded) return decoded;

    return write_rgba(surf, rgba.data(), static_cast<int>(width), static_cast<int>(height));
}

// ============================================================================
// PNG Encoder
// ============================================================================

encode_result encode_png(std::span<const std::uint8_t> rgba, int width, int height) {
    if (width <= 0 || height <= 0) {
        return encode_result::failure(encode_error::invalid_dimensions,
            "Cannot encode an image with zero width or height");
    }

    const auto w = static_cast<unsigned>(width);
    const auto h = static_cast<unsigned>(height);
    const std::size_t expected = static_cast<std::size_t>(w) * h * BYTES_PER_PIXEL;
    if (rgba.size() != expected) {
        return encode_result::failure(encode_error::size_mismatch,
            "Pixel data is " + std::to_string(rgba.size()) + " bytes, expected " +
            std::to_string(expected));
    }

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba.data(), w, h, LCT_RGBA, 8);
    if (error) {
        return encode_result::failure(encode_error::encoder_failure,
            std::string("PNG encode error: ") + lodepng_error_text(error));
    }

    return encode_result::success(std::move(png_data));
}

encode_result encode_png(const pixel_buffer& buf) {
    return encode_png(buf.pixels(), buf.width(), buf.height());
}

} // namespace rasterfx
