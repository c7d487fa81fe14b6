#ifndef RASTERFX_TYPES_HPP_
#define RASTERFX_TYPES_HPP_

#include <rasterfx/rasterfx_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rasterfx {

// ============================================================================
// Pixels
// ============================================================================

constexpr std::size_t BYTES_PER_PIXEL = 4;  // RGBA8888

struct rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    friend constexpr bool operator==(const rgba&, const rgba&) = default;
};

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    dimensions_exceeded,
    truncated_data,
    internal_error
};

[[nodiscard]] RASTERFX_EXPORT const char* to_string(decode_error err) noexcept;

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;
};

// ============================================================================
// Encode Errors
// ============================================================================

enum class encode_error {
    none,
    invalid_dimensions,
    size_mismatch,
    encoder_failure
};

[[nodiscard]] RASTERFX_EXPORT const char* to_string(encode_error err) noexcept;

struct encode_result {
    bool ok = false;
    encode_error error = encode_error::none;
    std::string message;
    std::vector<std::uint8_t> data;

    [[nodiscard]] static encode_result success(std::vector<std::uint8_t> bytes) {
        return {true, encode_error::none, {}, std::move(bytes)};
    }

    [[nodiscard]] static encode_result failure(encode_error err, std::string msg = {}) {
        return {false, err, std::move(msg), {}};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Filter Errors
// ============================================================================

enum class filter_error {
    none,
    decode_failed,
    unknown_filter,
    encode_failed,
    invalid_options
};

[[nodiscard]] RASTERFX_EXPORT const char* to_string(filter_error err) noexcept;

/**
 * Outcome of a full decode -> filter -> encode call.
 * On failure, data is always empty; decode_detail / encode_detail carry the
 * stage-specific cause when the failing stage was decoding or encoding.
 */
struct filter_result {
    bool ok = false;
    filter_error error = filter_error::none;
    decode_error decode_detail = decode_error::none;
    encode_error encode_detail = encode_error::none;
    std::string message;
    std::vector<std::uint8_t> data;

    [[nodiscard]] static filter_result success(std::vector<std::uint8_t> bytes = {}) {
        filter_result result;
        result.ok = true;
        result.data = std::move(bytes);
        return result;
    }

    [[nodiscard]] static filter_result failure(filter_error err, std::string msg = {}) {
        filter_result result;
        result.error = err;
        result.message = std::move(msg);
        return result;
    }

    [[nodiscard]] static filter_result from(const decode_result& decoded) {
        auto result = failure(filter_error::decode_failed, decoded.message);
        result.decode_detail = decoded.error;
        return result;
    }

    [[nodiscard]] static filter_result from(const encode_result& encoded) {
        auto result = failure(filter_error::encode_failed, encoded.message);
        result.encode_detail = encoded.error;
        return result;
    }

    explicit operator bool() const noexcept { return ok; }
};

} // namespace rasterfx

#endif // RASTERFX_TYPES_HPP_
