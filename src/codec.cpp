#include <icodec/codec.hpp>
#include <icodec/codecs/ico.hpp>
#include <icodec/codecs/png.hpp>

#include <algorithm>

namespace icodec {

// ============================================================================
// Decoder Wrappers
// ============================================================================

namespace {

template <typename Codec>
class static_decoder_impl : public decoder {
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

} // namespace

// ============================================================================
// Codec Registry Implementation
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    register_builtin_codecs();
}

codec_registry::~codec_registry() = default;

void codec_registry::register_builtin_codecs() {
    decoders_.push_back(std::make_unique<static_decoder_impl<ico_decoder>>());
    decoders_.push_back(std::make_unique<static_decoder_impl<png_decoder>>());
}

void codec_registry::register_decoder(std::unique_ptr<decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const decoder* codec_registry::find_decoder(std::span<const std::uint8_t> data) const {
    auto it = std::find_if(decoders_.begin(), decoders_.end(),
        [data](const auto& dec) { return dec->sniff(data); });
    return it != decoders_.end() ? it->get() : nullptr;
}

const decoder* codec_registry::find_decoder(std::string_view name) const {
    auto it = std::find_if(decoders_.begin(), decoders_.end(),
        [name](const auto& dec) { return dec->name() == name; });
    return it != decoders_.end() ? it->get() : nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(data);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format, "Unknown image format");
    }
    return dec->decode(data, surf, options);
}

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     std::string_view codec_name,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(codec_name);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    return dec->decode(data, surf, options);
}

} // namespace icodec
