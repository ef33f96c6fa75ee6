#ifndef ICODEC_ICON_FILE_HPP_
#define ICODEC_ICON_FILE_HPP_

#include <icodec/icodec_export.h>
#include <icodec/byte_source.hpp>
#include <icodec/icon_directory.hpp>
#include <icodec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace icodec {

// ============================================================================
// ICO/CUR Container Reader
// ============================================================================

/**
 * Reader for Windows ICO (icon) and CUR (cursor) containers.
 *
 * The container is read in a single forward pass: header, directory
 * table, then the image blocks in the order they appear in the file.
 * Each block is matched to the directory entry whose image offset equals
 * the number of bytes consumed so far.
 *
 * Supports:
 * - DIB resources with 1, 4, 8, 16, 24 and 32 bits per pixel
 * - PNG-compressed resources (Vista+ format)
 *
 * Failures of a single resource leave its image slot empty and do not
 * stop the pass. Header errors and source I/O errors fail the whole read.
 */
class ICODEC_EXPORT icon_file {
public:
    static constexpr std::size_t header_size = 6;
    static constexpr std::size_t dir_entry_size = 16;
    static constexpr std::size_t bitmap_info_header_size = 40;

    /**
     * Read an ICO/CUR container from a forward-only source.
     * @param src Byte source positioned at the start of the container
     * @param dir Receives the directory; untouched on failure
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result read(byte_source& src,
                                            icon_directory& dir,
                                            const decode_options& options = {});

    /**
     * Read an ICO/CUR container held in memory.
     */
    [[nodiscard]] static decode_result read(std::span<const std::uint8_t> data,
                                            icon_directory& dir,
                                            const decode_options& options = {});

    /**
     * Read an ICO/CUR file from disk.
     */
    [[nodiscard]] static decode_result read(const std::filesystem::path& path,
                                            icon_directory& dir,
                                            const decode_options& options = {});
};

// ============================================================================
// DIB Layout Helpers
// ============================================================================

/**
 * Number of color table entries for a DIB resource.
 *
 * A non-zero entry color count is used as is. Otherwise one plane gives
 * 2, 16 or 256 colors for 1, 4 and 8 bpp and 0 (true color, no table)
 * for any other depth; more planes give 2^(bit_count * planes).
 *
 * @return Color count, saturated at UINT64_MAX for absurd plane counts
 */
[[nodiscard]] ICODEC_EXPORT std::uint64_t resolve_color_count(std::uint8_t entry_color_count,
                                                             std::uint16_t planes,
                                                             std::uint16_t bit_count) noexcept;

// Bytes per XOR scanline, padded to 4 bytes
[[nodiscard]] ICODEC_EXPORT std::size_t xor_stride(int width, int bit_count) noexcept;

// Bytes per AND scanline, padded to 4 bytes
[[nodiscard]] ICODEC_EXPORT std::size_t and_stride(int width) noexcept;

} // namespace icodec

#endif // ICODEC_ICON_FILE_HPP_
