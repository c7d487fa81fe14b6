#include <doctest/doctest.h>
#include <rasterfx/rasterfx.hpp>

#include "helpers/images.hpp"

#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("apply_filter: error scenarios") {
    SUBCASE("Empty input is a decode failure") {
        auto result = rasterfx::apply_filter(std::vector<std::uint8_t>{}, "sepia");
        CHECK_FALSE(result.ok);
        CHECK(result.error == rasterfx::filter_error::decode_failed);
        CHECK(result.decode_detail == rasterfx::decode_error::truncated_data);
        CHECK(result.data.empty());
    }

    SUBCASE("Unknown filter name") {
        const auto png = test_images::to_png(test_images::make_gradient(2, 2));
        auto result = rasterfx::apply_filter(png, "oilpaint");
        CHECK_FALSE(result.ok);
        CHECK(result.error == rasterfx::filter_error::unknown_filter);
        CHECK(result.message.find("oilpaint") != std::string::npos);
        CHECK(result.data.empty());
    }

    SUBCASE("Filter names are case-sensitive") {
        const auto png = test_images::to_png(test_images::make_gradient(2, 2));
        CHECK(rasterfx::apply_filter(png, "Invert").error == rasterfx::filter_error::unknown_filter);
    }

    SUBCASE("Unknown filter is reported before the image is looked at") {
        auto result = rasterfx::apply_filter(std::vector<std::uint8_t>{}, "oilpaint");
        CHECK(result.error == rasterfx::filter_error::unknown_filter);
    }

    SUBCASE("Unrecognized image format") {
        const std::vector<std::uint8_t> text = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
        auto result = rasterfx::apply_filter(text, "blur");
        CHECK(result.error == rasterfx::filter_error::decode_failed);
        CHECK(result.decode_detail == rasterfx::decode_error::invalid_format);
    }

    SUBCASE("Truncated image") {
        const auto png = test_images::to_png(test_images::make_gradient(16, 16));
        const std::vector<std::uint8_t> cut(png.begin(), png.begin() + png.size() / 2);
        auto result = rasterfx::apply_filter(cut, "invert");
        CHECK(result.error == rasterfx::filter_error::decode_failed);
    }

    SUBCASE("Image over the configured size limit") {
        rasterfx::filter_options options;
        options.decode.max_height = 8;
        const auto png = test_images::to_png(test_images::make_gradient(4, 9));
        auto result = rasterfx::apply_filter(png, "grayscale", options);
        CHECK(result.error == rasterfx::filter_error::decode_failed);
        CHECK(result.decode_detail == rasterfx::decode_error::dimensions_exceeded);
    }
}

TEST_CASE("apply_filter: option validation") {
    const auto png = test_images::to_png(test_images::make_gradient(3, 3));

    SUBCASE("Defaults are valid") {
        CHECK(rasterfx::validate(rasterfx::filter_options{}).ok);
    }

    SUBCASE("Posterize needs at least two levels") {
        rasterfx::filter_options options;
        options.posterize_levels = 1;
        auto result = rasterfx::apply_filter(png, "posterize", options);
        CHECK(result.error == rasterfx::filter_error::invalid_options);
    }

    SUBCASE("Pixelate block must be positive") {
        rasterfx::filter_options options;
        options.pixelate_block_size = 0;
        CHECK(rasterfx::validate(options).error == rasterfx::filter_error::invalid_options);
    }

    SUBCASE("Blur sigma must be positive") {
        rasterfx::filter_options options;
        options.blur_sigma = 0.0f;
        CHECK(rasterfx::validate(options).error == rasterfx::filter_error::invalid_options);
        options.blur_sigma = 100.0f;
        CHECK(rasterfx::validate(options).error == rasterfx::filter_error::invalid_options);
    }

    SUBCASE("Emboss offset must fit a channel") {
        rasterfx::filter_options options;
        options.emboss_offset = 256;
        CHECK(rasterfx::validate(options).error == rasterfx::filter_error::invalid_options);
    }
}

TEST_CASE("apply_filter: single pixel invert") {
    const auto png = test_images::to_png(test_images::make_solid(1, 1, {10, 20, 30, 200}));

    auto result = rasterfx::apply_filter(png, "invert");
    REQUIRE(result.ok);
    CHECK(result.error == rasterfx::filter_error::none);
    CHECK(rasterfx::png_decoder::sniff(result.data));

    const auto out = test_images::decode_png(result.data);
    CHECK(out.width() == 1);
    CHECK(out.height() == 1);
    CHECK(out.at(0, 0) == rasterfx::rgba{245, 235, 225, 200});
}

TEST_CASE("apply_filter: every filter returns a PNG of the same shape") {
    const auto png = test_images::to_png(test_images::make_gradient(7, 5));
    for (const auto kind : rasterfx::all_filter_kinds) {
        const std::string name = rasterfx::to_string(kind);
        INFO("Filter: ", name);

        auto result = rasterfx::apply_filter(png, name);
        REQUIRE(result.ok);
        const auto out = test_images::decode_png(result.data);
        CHECK(out.width() == 7);
        CHECK(out.height() == 5);
    }
}

TEST_CASE("apply_filter: output matches the kernel") {
    const auto src = test_images::make_gradient(10, 10);
    const auto png = test_images::to_png(src);

    auto result = rasterfx::apply_filter(png, rasterfx::filter_kind::sharpen);
    REQUIRE(result.ok);
    CHECK(test_images::same_pixels(test_images::decode_png(result.data), rasterfx::sharpen(src)));
}

TEST_CASE("apply_filter: non-PNG input becomes PNG output") {
    // 1x1 24-bit BMP, pure green
    const std::vector<std::uint8_t> bmp = {
        'B', 'M', 58, 0, 0, 0, 0, 0, 0, 0, 54, 0, 0, 0,
        40, 0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 1, 0, 24, 0,
        0, 0, 0, 0, 4, 0, 0, 0, 0x13, 0x0B, 0, 0, 0x13, 0x0B, 0, 0,
        0, 0, 0, 0, 0, 0, 0, 0,
        0x00, 0xFF, 0x00, 0x00
    };

    auto result = rasterfx::apply_filter(bmp, "invert");
    REQUIRE(result.ok);
    CHECK(rasterfx::png_decoder::sniff(result.data));
    CHECK(test_images::decode_png(result.data).at(0, 0) == rasterfx::rgba{255, 0, 255, 255});
}

TEST_CASE("apply_filter: deterministic") {
    const auto png = test_images::to_png(test_images::make_gradient(9, 4));
    auto first = rasterfx::apply_filter(png, "huerotate");
    auto second = rasterfx::apply_filter(png, "huerotate");
    REQUIRE(first.ok);
    REQUIRE(second.ok);
    CHECK(first.data == second.data);
}

TEST_CASE("apply_filter: repeated application stays lossless") {
    const auto png = test_images::to_png(test_images::make_gradient(6, 6));
    auto once = rasterfx::apply_filter(png, "invert");
    REQUIRE(once.ok);
    auto twice = rasterfx::apply_filter(once.data, "invert");
    REQUIRE(twice.ok);
    CHECK(test_images::same_pixels(test_images::decode_png(twice.data),
                                   test_images::decode_png(png)));
}
