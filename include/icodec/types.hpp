#ifndef ICODEC_TYPES_HPP_
#define ICODEC_TYPES_HPP_

#include <icodec/icodec_export.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace icodec {

class decoder;

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    rgb888,     // 24-bit, 8-bit RGB components, no alpha
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::rgb888:   return 3;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Resource Types
// ============================================================================

enum class resource_type : std::uint16_t {
    unknown = 0,
    icon = 1,
    cursor = 2
};

[[nodiscard]] ICODEC_EXPORT const char* to_string(resource_type type) noexcept;

// ============================================================================
// Subrect Metadata (for atlas output)
// ============================================================================

struct image_rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

enum class subrect_kind {
    sprite
};

struct subrect {
    image_rect rect;
    subrect_kind kind = subrect_kind::sprite;
    std::uint32_t user_tag = 0;
};

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_header,             // Reserved word is not 0
    unsupported_resource_type,  // Type is neither icon nor cursor
    invalid_format,
    unsupported_encoding,       // Compressed DIB
    unsupported_bit_depth,      // Bit count or color table size
    dimensions_exceeded,
    truncated_data,
    io_error,
    internal_error
};

[[nodiscard]] ICODEC_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed image dimensions (0 = use the icon default of 256)
    int max_width = 0;
    int max_height = 0;

    // Largest embedded PNG payload that will be buffered
    std::size_t max_resource_size = 16u * 1024u * 1024u;

    // Decoder for PNG-compressed resources (nullptr = built-in lodepng decoder)
    const decoder* png_delegate = nullptr;

    // Vertical gap between images in ico_decoder atlases
    int padding = 0;
};

} // namespace icodec

#endif // ICODEC_TYPES_HPP_
