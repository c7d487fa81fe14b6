#include <doctest/doctest.h>
#include <rasterfx/rasterfx.hpp>

#include "helpers/images.hpp"

#include <cstdint>
#include <vector>

namespace {

// Signature + IHDR header only, enough for the dimension pre-check
std::vector<std::uint8_t> png_header(std::uint32_t width, std::uint32_t height) {
    std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                                      0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
    for (const auto v : {width, height}) {
        data.push_back(static_cast<std::uint8_t>(v >> 24));
        data.push_back(static_cast<std::uint8_t>(v >> 16));
        data.push_back(static_cast<std::uint8_t>(v >> 8));
        data.push_back(static_cast<std::uint8_t>(v));
    }
    // bit depth, color type, compression, filter, interlace, CRC
    for (const std::uint8_t b : {8, 6, 0, 0, 0, 0, 0, 0, 0}) {
        data.push_back(b);
    }
    return data;
}

} // namespace

TEST_CASE("PNG decoder: sniff") {
    SUBCASE("Valid PNG signature") {
        std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
        CHECK(rasterfx::png_decoder::sniff(data));
    }

    SUBCASE("Invalid signature") {
        std::vector<std::uint8_t> data = {0x89, 'P', 'N', 'X', 0x0D, 0x0A, 0x1A, 0x0A};
        CHECK_FALSE(rasterfx::png_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {0x89, 'P', 'N', 'G'};
        CHECK_FALSE(rasterfx::png_decoder::sniff(data));
    }
}

TEST_CASE("PNG decoder: color types are normalized to RGBA") {
    SUBCASE("RGBA keeps alpha") {
        const auto png = test_images::make_png({1, 2, 3, 4, 250, 251, 252, 0}, 2, 1, LCT_RGBA);
        const auto buf = test_images::decode_png(png);
        CHECK(buf.width() == 2);
        CHECK(buf.height() == 1);
        CHECK(buf.at(0, 0) == rasterfx::rgba{1, 2, 3, 4});
        CHECK(buf.at(1, 0) == rasterfx::rgba{250, 251, 252, 0});
    }

    SUBCASE("RGB gets full opacity") {
        const auto png = test_images::make_png({255, 0, 0, 0, 128, 64}, 1, 2, LCT_RGB);
        const auto buf = test_images::decode_png(png);
        CHECK(buf.width() == 1);
        CHECK(buf.height() == 2);
        CHECK(buf.at(0, 0) == rasterfx::rgba{255, 0, 0, 255});
        CHECK(buf.at(0, 1) == rasterfx::rgba{0, 128, 64, 255});
    }

    SUBCASE("Grayscale expands to RGB") {
        const auto png = test_images::make_png({0, 77, 200}, 3, 1, LCT_GREY);
        const auto buf = test_images::decode_png(png);
        CHECK(buf.at(0, 0) == rasterfx::rgba{0, 0, 0, 255});
        CHECK(buf.at(1, 0) == rasterfx::rgba{77, 77, 77, 255});
        CHECK(buf.at(2, 0) == rasterfx::rgba{200, 200, 200, 255});
    }

    SUBCASE("Grayscale with alpha") {
        const auto png = test_images::make_png({90, 30}, 1, 1, LCT_GREY_ALPHA);
        const auto buf = test_images::decode_png(png);
        CHECK(buf.at(0, 0) == rasterfx::rgba{90, 90, 90, 30});
    }
}

TEST_CASE("PNG decoder: malformed input") {
    const auto valid = test_images::to_png(test_images::make_gradient(8, 8));

    SUBCASE("Header cut short") {
        std::vector<std::uint8_t> data(valid.begin(), valid.begin() + 12);
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::png_decoder::decode(data, buf);
        CHECK_FALSE(result.ok);
        CHECK(result.error == rasterfx::decode_error::truncated_data);
    }

    SUBCASE("Image data cut short") {
        std::vector<std::uint8_t> data(valid.begin(), valid.begin() + valid.size() / 2);
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::png_decoder::decode(data, buf);
        CHECK_FALSE(result.ok);
        CHECK(result.error == rasterfx::decode_error::invalid_format);
        CHECK_FALSE(result.message.empty());
    }

    SUBCASE("Zero width") {
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::png_decoder::decode(png_header(0, 4), buf);
        CHECK(result.error == rasterfx::decode_error::invalid_format);
    }

    SUBCASE("Dimensions above the default limit") {
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::png_decoder::decode(png_header(20000, 4), buf);
        CHECK(result.error == rasterfx::decode_error::dimensions_exceeded);
    }

    SUBCASE("Dimensions above a caller limit") {
        rasterfx::decode_options options;
        options.max_width = 4;
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::png_decoder::decode(valid, buf, options);
        CHECK(result.error == rasterfx::decode_error::dimensions_exceeded);
    }
}

TEST_CASE("PNG encoder") {
    SUBCASE("Decode then encode preserves shape and pixels") {
        const auto original = test_images::make_gradient(13, 7);
        const auto decoded = test_images::decode_png(test_images::to_png(original));
        CHECK(decoded.width() == 13);
        CHECK(decoded.height() == 7);
        CHECK(test_images::same_pixels(original, decoded));
    }

    SUBCASE("Output is a PNG stream") {
        const auto png = test_images::to_png(test_images::make_solid(1, 1, {1, 2, 3, 255}));
        CHECK(rasterfx::png_decoder::sniff(png));
    }

    SUBCASE("Raw data with the wrong length") {
        const std::vector<std::uint8_t> rgba(15, 0);
        auto result = rasterfx::encode_png(rgba, 2, 2);
        CHECK_FALSE(result.ok);
        CHECK(result.error == rasterfx::encode_error::size_mismatch);
        CHECK(result.data.empty());
    }

    SUBCASE("Empty buffer") {
        rasterfx::pixel_buffer buf;
        auto result = rasterfx::encode_png(buf);
        CHECK(result.error == rasterfx::encode_error::invalid_dimensions);
    }
}
