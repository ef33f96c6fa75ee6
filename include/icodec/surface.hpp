#ifndef ICODEC_SURFACE_HPP_
#define ICODEC_SURFACE_HPP_

#include <icodec/icodec_export.h>
#include <icodec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace icodec {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for image surfaces.
 * Codecs write pixels to surfaces, allowing framework-agnostic decoding.
 */
class ICODEC_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     *
     * @param x Starting byte offset within the row
     * @param y Row number
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;

    /**
     * Set a subrect for multi-image atlases.
     * @param index Subrect index
     * @param sr Subrect metadata
     */
    virtual void set_subrect(int index, const subrect& sr) {
        (void)index;
        (void)sr;
    }
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 */
class ICODEC_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;
    void set_subrect(int index, const subrect& sr) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] const std::vector<subrect>& subrects() const noexcept { return subrects_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<subrect> subrects_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace icodec

#endif // ICODEC_SURFACE_HPP_
