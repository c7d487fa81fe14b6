#include <rasterfx/engine.hpp>
#include <rasterfx/codec.hpp>
#include <rasterfx/codecs/png.hpp>

#include <string>

namespace rasterfx {

filter_result validate(const filter_options& options) {
    if (!(options.blur_sigma > 0.0f) || options.blur_sigma > 64.0f) {
        return filter_result::failure(filter_error::invalid_options,
            "blur_sigma must be in (0, 64]");
    }
    if (options.posterize_levels < 2 || options.posterize_levels > 256) {
        return filter_result::failure(filter_error::invalid_options,
            "posterize_levels must be in [2, 256]");
    }
    if (options.pixelate_block_size < 1) {
        return filter_result::failure(filter_error::invalid_options,
            "pixelate_block_size must be at least 1");
    }
    if (options.emboss_offset < 0 || options.emboss_offset > 255) {
        return filter_result::failure(filter_error::invalid_options,
            "emboss_offset must be in [0, 255]");
    }
    return filter_result::success();
}

filter_result apply_filter(std::span<const std::uint8_t> image_bytes,
                           std::string_view filter_name,
                           const filter_options& options) {
    const auto kind = parse_filter_kind(filter_name);
    if (!kind) {
        return filter_result::failure(filter_error::unknown_filter,
            "Unknown filter: " + std::string(filter_name));
    }
    return apply_filter(image_bytes, *kind, options);
}

filter_result apply_filter(std::span<const std::uint8_t> image_bytes,
                           filter_kind kind,
                           const filter_options& options) {
    auto checked = validate(options);
    if (!checked) return checked;

    pixel_buffer image;
    auto decoded = decode(image_bytes, image, options.decode);
    if (!decoded) {
        return filter_result::from(decoded);
    }

    const pixel_buffer filtered = apply(kind, image, options);

    auto encoded = encode_png(filtered);
    if (!encoded) {
        return filter_result::from(encoded);
    }

    return filter_result::success(std::move(encoded.data));
}

} // namespace rasterfx
