#ifndef RASTERFX_ENGINE_HPP_
#define RASTERFX_ENGINE_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/filters.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace rasterfx {

/**
 * Check filter options against their valid ranges.
 * @return success(), or invalid_options naming the offending field
 */
[[nodiscard]] RASTERFX_EXPORT filter_result validate(const filter_options& options);

/**
 * Decode an image, apply one filter and encode the result as PNG.
 *
 * The filter name is resolved before the image is decoded, so an unknown
 * name is reported as unknown_filter regardless of the image bytes.
 *
 * @param image_bytes Encoded image (PNG, JPEG, GIF, BMP or TGA)
 * @param filter_name One of the names returned by to_string(filter_kind)
 * @param options Filter parameters and decode limits
 * @return Result holding PNG bytes on success
 */
[[nodiscard]] RASTERFX_EXPORT filter_result apply_filter(std::span<const std::uint8_t> image_bytes,
                                                          std::string_view filter_name,
                                                          const filter_options& options = {});

[[nodiscard]] RASTERFX_EXPORT filter_result apply_filter(std::span<const std::uint8_t> image_bytes,
                                                          filter_kind kind,
                                                          const filter_options& options = {});

} // namespace rasterfx

#endif // RASTERFX_ENGINE_HPP_
