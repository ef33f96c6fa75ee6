#include <icodec/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>

namespace icodec {

bool memory_surface::set_size(int width, int height, pixel_format format) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    if (w > std::numeric_limits<std::size_t>::max() / bpp) {
        return false;
    }
    const std::size_t pitch = w * bpp;

    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    const std::size_t total_size = pitch * h;

    // Atlases of 256x256 icons stay far below this
    constexpr std::size_t MAX_BUFFER_SIZE = 256ULL * 1024ULL * 1024ULL;
    if (total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    subrects_.clear();

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t x_offset = static_cast<std::size_t>(x);
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t offset = static_cast<std::size_t>(y) * pitch_ + x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), pitch_ - x_offset);

    if (offset + bytes_to_copy <= pixels_.size()) {
        std::memcpy(pixels_.data() + offset, pixels, bytes_to_copy);
    }
}

void memory_surface::set_subrect(int index, const subrect& sr) {
    if (index < 0) {
        return;
    }

    if (static_cast<std::size_t>(index) >= subrects_.size()) {
        subrects_.resize(static_cast<std::size_t>(index) + 1);
    }
    subrects_[static_cast<std::size_t>(index)] = sr;
}

} // namespace icodec
