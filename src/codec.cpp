#include <rasterfx/codec.hpp>
#include <rasterfx/codecs/png.hpp>
#include <rasterfx/codecs/stb.hpp>

#include <string>

namespace rasterfx {

namespace {

// Runtime face of a codec class with static name/extensions/sniff/decode
template <typename Codec>
class decoder_impl final : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Codec::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Codec::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return Codec::sniff(data);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const override {
        return Codec::decode(data, surf, options);
    }
};

template <typename... Codecs>
std::vector<std::unique_ptr<decoder>> make_decoders() {
    std::vector<std::unique_ptr<decoder>> out;
    out.reserve(sizeof...(Codecs));
    (out.push_back(std::make_unique<decoder_impl<Codecs>>()), ...);
    return out;
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

const codec_registry& codec_registry::instance() {
    static const codec_registry registry;
    return registry;
}

codec_registry::codec_registry()
    : decoders_(make_decoders<png_decoder, jpeg_decoder, gif_decoder, bmp_decoder,
                              tga_decoder>()) {}

codec_registry::~codec_registry() = default;

const decoder* codec_registry::detect(std::span<const std::uint8_t> data) const noexcept {
    for (const auto& dec : decoders_) {
        if (dec->sniff(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* codec_registry::by_name(std::string_view name) const noexcept {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Decode
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     const decode_options& options) {
    if (data.empty()) {
        return decode_result::failure(decode_error::truncated_data, "Input is empty");
    }
    const decoder* dec = codec_registry::instance().detect(data);
    if (dec == nullptr) {
        return decode_result::failure(decode_error::invalid_format,
            "Not a PNG, JPEG, GIF, BMP or TGA image");
    }
    return dec->decode(data, surf, options);
}

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     std::string_view codec_name,
                     const decode_options& options) {
    const decoder* dec = codec_registry::instance().by_name(codec_name);
    if (dec == nullptr) {
        return decode_result::failure(decode_error::invalid_format,
            "No decoder named '" + std::string(codec_name) + "'");
    }
    if (data.empty()) {
        return decode_result::failure(decode_error::truncated_data, "Input is empty");
    }
    return dec->decode(data, surf, options);
}

} // namespace rasterfx
