#ifndef ICODEC_CODECS_ICO_HPP_
#define ICODEC_CODECS_ICO_HPP_

#include <icodec/icodec_export.h>
#include <icodec/types.hpp>
#include <icodec/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace icodec {

// ============================================================================
// ICO/CUR Surface Decoder
// ============================================================================

/**
 * Decodes a whole ICO/CUR container to a single surface.
 *
 * Output:
 * - Every successfully decoded image, stacked vertically in directory
 *   order into one RGBA atlas (decode_options::padding rows apart)
 * - One subrect per image
 *   - subrect.kind = subrect_kind::sprite
 *   - subrect.user_tag = directory record index
 *
 * Use icon_file::read for per-entry access and directory metadata.
 */
class ICODEC_EXPORT ico_decoder {
public:
    static constexpr std::string_view name = "ico";
    static constexpr std::string_view extensions[] = {".ico", ".cur"};

    /**
     * Check if data appears to be an ICO/CUR file.
     * @param data Raw file data
     * @return true if the header matches ICO/CUR format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode ICO/CUR file to an atlas surface.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

} // namespace icodec

#endif // ICODEC_CODECS_ICO_HPP_
