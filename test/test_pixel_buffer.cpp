#include <doctest/doctest.h>
#include <rasterfx/rasterfx.hpp>

#include "helpers/images.hpp"

#include <cstdint>
#include <vector>

TEST_CASE("pixel_buffer: set_size") {
    SUBCASE("Allocates zeroed RGBA storage") {
        rasterfx::pixel_buffer buf;
        REQUIRE(buf.set_size(3, 2));
        CHECK(buf.width() == 3);
        CHECK(buf.height() == 2);
        CHECK(buf.pitch() == 12);
        CHECK(buf.pixels().size() == 24);
        CHECK(buf.at(2, 1) == rasterfx::rgba{0, 0, 0, 0});
    }

    SUBCASE("Rejects zero and negative dimensions") {
        rasterfx::pixel_buffer buf;
        CHECK_FALSE(buf.set_size(0, 5));
        CHECK_FALSE(buf.set_size(5, 0));
        CHECK_FALSE(buf.set_size(-1, 5));
        CHECK(buf.empty());
    }

    SUBCASE("Rejects sizes over the buffer limit") {
        rasterfx::pixel_buffer buf;
        CHECK_FALSE(buf.set_size(1 << 16, 1 << 16));
    }
}

TEST_CASE("pixel_buffer: pixel access") {
    rasterfx::pixel_buffer buf;
    REQUIRE(buf.set_size(2, 2));

    buf.set(1, 0, {10, 20, 30, 40});
    CHECK(buf.at(1, 0) == rasterfx::rgba{10, 20, 30, 40});
    CHECK(buf.pixels()[4] == 10);
    CHECK(buf.pixels()[7] == 40);

    SUBCASE("Out of range reads return transparent black") {
        CHECK(buf.at(-1, 0) == rasterfx::rgba{});
        CHECK(buf.at(2, 0) == rasterfx::rgba{});
        CHECK(buf.at(0, 2) == rasterfx::rgba{});
    }

    SUBCASE("Out of range writes are ignored") {
        buf.set(5, 5, {1, 2, 3, 4});
        for (const auto v : buf.pixels().subspan(8)) {
            CHECK(v == 0);
        }
    }
}

TEST_CASE("pixel_buffer: write_pixels clips to the row") {
    rasterfx::pixel_buffer buf;
    REQUIRE(buf.set_size(2, 2));

    const std::vector<std::uint8_t> row(16, 0xAB);
    buf.write_pixels(4, 0, 16, row.data());

    CHECK(buf.at(0, 0) == rasterfx::rgba{0, 0, 0, 0});
    CHECK(buf.at(1, 0) == rasterfx::rgba{0xAB, 0xAB, 0xAB, 0xAB});
    // Second row untouched
    CHECK(buf.at(0, 1) == rasterfx::rgba{0, 0, 0, 0});
}

TEST_CASE("pixel_buffer: clone is independent") {
    auto original = test_images::make_solid(2, 2, {1, 2, 3, 4});
    auto copy = original.clone();
    copy.set(0, 0, {9, 9, 9, 9});

    CHECK(original.at(0, 0) == rasterfx::rgba{1, 2, 3, 4});
    CHECK(copy.at(0, 0) == rasterfx::rgba{9, 9, 9, 9});
    CHECK(copy.width() == 2);
    CHECK(copy.height() == 2);
}
