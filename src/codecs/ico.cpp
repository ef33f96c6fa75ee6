#include <icodec/codecs/ico.hpp>
#include <icodec/icon_file.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <vector>

namespace icodec {

namespace {

constexpr int MAX_ATLAS_HEIGHT = 65536;

// Stack decoded images vertically
decode_result create_icon_atlas(const icon_directory& dir, surface& surf, int padding) {
    std::vector<std::uint16_t> indices;
    std::size_t atlas_width = 0;
    std::size_t atlas_height = 0;

    const auto& images = dir.images();
    for (std::size_t i = 0; i < images.size(); ++i) {
        if (!images[i]) continue;

        if (!indices.empty()) {
            atlas_height += static_cast<std::size_t>(padding);
        }
        atlas_width = std::max(atlas_width, static_cast<std::size_t>(images[i]->width));
        atlas_height += static_cast<std::size_t>(images[i]->height);
        indices.push_back(static_cast<std::uint16_t>(i));

        if (atlas_height > static_cast<std::size_t>(MAX_ATLAS_HEIGHT)) {
            return decode_result::failure(decode_error::dimensions_exceeded,
                "ICO atlas height exceeds limits");
        }
    }

    if (indices.empty()) {
        return decode_result::failure(decode_error::invalid_format, "No decodable icons");
    }

    if (!surf.set_size(static_cast<int>(atlas_width), static_cast<int>(atlas_height), pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    int y_offset = 0;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        const decoded_image& image = *images[indices[i]];

        write_rows(surf, image.pixels.data(), static_cast<std::size_t>(image.width) * 4,
                   image.height, y_offset);

        subrect sr;
        sr.rect = {0, y_offset, image.width, image.height};
        sr.kind = subrect_kind::sprite;
        sr.user_tag = indices[i];
        surf.set_subrect(static_cast<int>(i), sr);

        y_offset += image.height + padding;
    }

    return decode_result::success();
}

} // namespace

// ============================================================================
// ICO Decoder
// ============================================================================

bool ico_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < icon_file::header_size) return false;
    const std::uint16_t reserved = read_le16(data.data());
    const std::uint16_t type = read_le16(data.data() + 2);
    const std::uint16_t count = read_le16(data.data() + 4);
    return reserved == 0 && (type == 1 || type == 2) && count > 0;
}

decode_result ico_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    icon_directory dir;
    auto result = icon_file::read(data, dir, options);
    if (!result) {
        return result;
    }

    if (dir.count() == 0) {
        return decode_result::failure(decode_error::invalid_format, "ICO file has no images");
    }

    return create_icon_atlas(dir, surf, std::max(options.padding, 0));
}

} // namespace icodec
