#ifndef ICODEC_ICON_DIRECTORY_HPP_
#define ICODEC_ICON_DIRECTORY_HPP_

#include <icodec/icodec_export.h>
#include <icodec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace icodec {

// ============================================================================
// DIB Structures
// ============================================================================

// BITMAPINFOHEADER
struct bitmap_info_header {
    std::uint32_t size = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;      // Doubled for icons (XOR + AND planes)
    std::uint16_t planes = 0;
    std::uint16_t bit_count = 0;
    std::uint32_t compression = 0;
    std::uint32_t size_image = 0;
    std::int32_t x_pels_per_meter = 0;
    std::int32_t y_pels_per_meter = 0;
    std::uint32_t clr_used = 0;
    std::uint32_t clr_important = 0;
};

// RGBQUAD color table entry
struct rgb_quad {
    std::uint8_t blue = 0;
    std::uint8_t green = 0;
    std::uint8_t red = 0;
    std::uint8_t reserved = 0;

    [[nodiscard]] constexpr std::uint32_t rgb() const noexcept {
        return (static_cast<std::uint32_t>(red) << 16) |
               (static_cast<std::uint32_t>(green) << 8) |
               static_cast<std::uint32_t>(blue);
    }
};

/**
 * Raw bitmap data of a DIB icon resource, as stored in the file.
 * Not present for PNG resources.
 */
struct icon_bitmap {
    bitmap_info_header header;
    std::vector<rgb_quad> colors;
    std::vector<std::uint8_t> xor_mask;
    std::vector<std::uint8_t> and_mask;
};

// ============================================================================
// Decoded Image
// ============================================================================

/**
 * RGBA8888 pixel buffer, row-major with the top row first.
 */
struct ICODEC_EXPORT decoded_image {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    /**
     * Pixel at (x, y) packed as 0xAARRGGBB.
     * Coordinates must be inside the image.
     */
    [[nodiscard]] std::uint32_t argb(int x, int y) const noexcept;
};

// ============================================================================
// Directory Entry
// ============================================================================

// ICONDIRENTRY as stored in the file
struct dir_entry_record {
    std::uint8_t width = 0;        // 0 = 256
    std::uint8_t height = 0;       // 0 = 256
    std::uint8_t color_count = 0;  // 0 if >= 8bpp
    std::uint8_t reserved = 0;     // Must be 0
    std::uint16_t planes = 0;      // Color planes (ICO) or hotspot X (CUR)
    std::uint16_t bit_count = 0;   // Bits per pixel (ICO) or hotspot Y (CUR)
    std::uint32_t bytes_in_resource = 0;
    std::uint32_t image_offset = 0;
};

/**
 * One image resource of an ICO/CUR file. Immutable.
 */
class ICODEC_EXPORT directory_entry {
public:
    directory_entry(const dir_entry_record& record,
                    std::uint16_t index,
                    std::shared_ptr<const decoded_image> image,
                    std::shared_ptr<const icon_bitmap> bitmap,
                    decode_error error = decode_error::none);

    [[nodiscard]] std::uint8_t width() const noexcept { return record_.width; }
    [[nodiscard]] std::uint8_t height() const noexcept { return record_.height; }
    [[nodiscard]] std::uint8_t color_count() const noexcept { return record_.color_count; }
    [[nodiscard]] std::uint8_t reserved() const noexcept { return record_.reserved; }
    [[nodiscard]] std::uint16_t planes() const noexcept { return record_.planes; }
    [[nodiscard]] std::uint16_t bit_count() const noexcept { return record_.bit_count; }
    [[nodiscard]] std::uint32_t bytes_in_resource() const noexcept { return record_.bytes_in_resource; }
    [[nodiscard]] std::uint32_t image_offset() const noexcept { return record_.image_offset; }

    // Cursor hotspot, aliases of planes and bit count
    [[nodiscard]] std::uint16_t hotspot_x() const noexcept { return record_.planes; }
    [[nodiscard]] std::uint16_t hotspot_y() const noexcept { return record_.bit_count; }

    // Dimensions with 0 mapped to 256
    [[nodiscard]] int pixel_width() const noexcept { return record_.width == 0 ? 256 : record_.width; }
    [[nodiscard]] int pixel_height() const noexcept { return record_.height == 0 ? 256 : record_.height; }

    // Position of the record in the file's directory table
    [[nodiscard]] std::uint16_t index() const noexcept { return index_; }

    // Decoded pixels, null if the resource failed to decode
    [[nodiscard]] const decoded_image* image() const noexcept { return image_.get(); }

    // DIB data, null for PNG resources and failed decodes
    [[nodiscard]] const icon_bitmap* bitmap() const noexcept { return bitmap_.get(); }

    /**
     * Why image() is null. decode_error::none when the image decoded, and
     * also when the pass ended before reaching this entry's resource.
     */
    [[nodiscard]] decode_error error() const noexcept { return error_; }

    [[nodiscard]] const dir_entry_record& record() const noexcept { return record_; }

private:
    dir_entry_record record_;
    std::uint16_t index_;
    std::shared_ptr<const decoded_image> image_;
    std::shared_ptr<const icon_bitmap> bitmap_;
    decode_error error_;
};

// ============================================================================
// Icon Directory
// ============================================================================

/**
 * Parsed ICO/CUR container. Produced by icon_file::read and immutable
 * afterwards, so it can be shared between threads without locking.
 */
class ICODEC_EXPORT icon_directory {
public:
    icon_directory() = default;
    icon_directory(std::uint16_t reserved,
                   std::uint16_t type,
                   std::uint16_t count,
                   std::vector<directory_entry> entries,
                   std::vector<std::shared_ptr<const decoded_image>> images);

    [[nodiscard]] std::uint16_t reserved() const noexcept { return reserved_; }
    [[nodiscard]] std::uint16_t type_value() const noexcept { return type_; }
    [[nodiscard]] resource_type type() const noexcept;

    // Image count declared in the header; may exceed entries().size()
    [[nodiscard]] std::uint16_t count() const noexcept { return count_; }

    // Usable entries in directory order
    [[nodiscard]] const std::vector<directory_entry>& entries() const noexcept { return entries_; }

    /**
     * Decoded images, one slot per declared directory record.
     * Dropped or undecodable records yield null.
     */
    [[nodiscard]] const std::vector<std::shared_ptr<const decoded_image>>& images() const noexcept {
        return images_;
    }

    /**
     * @param index Directory record index (0 to count()-1)
     * @return Decoded image, or nullptr if absent or out of range
     */
    [[nodiscard]] const decoded_image* image(std::size_t index) const noexcept {
        return index < images_.size() ? images_[index].get() : nullptr;
    }

private:
    std::uint16_t reserved_ = 0;
    std::uint16_t type_ = 0;
    std::uint16_t count_ = 0;
    std::vector<directory_entry> entries_;
    std::vector<std::shared_ptr<const decoded_image>> images_;
};

} // namespace icodec

#endif // ICODEC_ICON_DIRECTORY_HPP_
