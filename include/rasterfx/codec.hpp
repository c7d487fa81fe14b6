#ifndef RASTERFX_CODEC_HPP_
#define RASTERFX_CODEC_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace rasterfx {

// ============================================================================
// Input Formats
// ============================================================================

/**
 * One input format. Implementations hold no state; every decode() writes
 * RGBA8888 into the surface it is given.
 */
class RASTERFX_EXPORT decoder {
public:
    virtual ~decoder() = default;

    // Lowercase identifier ("png", "jpeg", ...), accepted by decode(..., name)
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    // Usual file extensions, for listings
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> data,
                                                surface& surf,
                                                const decode_options& options) const = 0;
};

/**
 * The fixed set of formats apply_filter() accepts: PNG, JPEG, GIF, BMP, TGA.
 *
 * Order is detection order. TGA has no signature and is matched on header
 * plausibility alone, so it comes last. The table is filled once on first
 * use and never changes afterwards, which makes every lookup thread-safe.
 */
class RASTERFX_EXPORT codec_registry {
public:
    [[nodiscard]] static const codec_registry& instance();

    /**
     * First format whose signature matches the leading bytes of data.
     * @return nullptr if none matches
     */
    [[nodiscard]] const decoder* detect(std::span<const std::uint8_t> data) const noexcept;

    /**
     * Format with the given name() ("png", "jpeg", "gif", "bmp", "tga").
     * @return nullptr for any other name
     */
    [[nodiscard]] const decoder* by_name(std::string_view name) const noexcept;

    [[nodiscard]] std::span<const std::unique_ptr<decoder>> decoders() const noexcept {
        return decoders_;
    }

private:
    codec_registry();
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    std::vector<std::unique_ptr<decoder>> decoders_;
};

// ============================================================================
// Decode
// ============================================================================

/**
 * Detect the format of data and decode it into surf.
 * Empty input fails with truncated_data, an unmatched signature with
 * invalid_format.
 */
[[nodiscard]] RASTERFX_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                    surface& surf,
                                                    const decode_options& options = {});

/**
 * Decode data as the named format, skipping detection.
 * An unknown name fails with invalid_format before data is inspected.
 */
[[nodiscard]] RASTERFX_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                    surface& surf,
                                                    std::string_view codec_name,
                                                    const decode_options& options = {});

} // namespace rasterfx

#endif // RASTERFX_CODEC_HPP_
