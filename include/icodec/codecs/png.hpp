#ifndef ICODEC_CODECS_PNG_HPP_
#define ICODEC_CODECS_PNG_HPP_

#include <icodec/icodec_export.h>
#include <icodec/icon_directory.hpp>
#include <icodec/types.hpp>
#include <icodec/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace icodec {

// ============================================================================
// PNG Decoder
// ============================================================================

/**
 * lodepng-backed decoder used for PNG-compressed icon resources.
 */
class ICODEC_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to an RGBA surface.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a decoded icon image to PNG format.
 * @param image Source image
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] ICODEC_EXPORT std::vector<std::uint8_t> encode_png(const decoded_image& image);

/**
 * Save a decoded icon image to a PNG file.
 * @param image Source image
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] ICODEC_EXPORT bool save_png(const decoded_image& image,
                                           const std::filesystem::path& path);

} // namespace icodec

#endif // ICODEC_CODECS_PNG_HPP_
