#pragma once

#include <cstddef>
#include <cstdint>

namespace rasterfx {

// Unsigned integer stored in sizeof(T) bytes at p. Callers check the length.
template <typename T>
constexpr T load_le(const std::uint8_t* p) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>(value | (static_cast<T>(p[i]) << (8 * i)));
    }
    return value;
}

template <typename T>
constexpr T load_be(const std::uint8_t* p) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | p[i]);
    }
    return value;
}

} // namespace rasterfx
