#include <icodec/icon_directory.hpp>

#include <utility>

namespace icodec {

std::uint32_t decoded_image::argb(int x, int y) const noexcept {
    const std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                             static_cast<std::size_t>(x)) * 4;
    return (static_cast<std::uint32_t>(pixels[idx + 3]) << 24) |
           (static_cast<std::uint32_t>(pixels[idx + 0]) << 16) |
           (static_cast<std::uint32_t>(pixels[idx + 1]) << 8) |
           static_cast<std::uint32_t>(pixels[idx + 2]);
}

directory_entry::directory_entry(const dir_entry_record& record,
                                 std::uint16_t index,
                                 std::shared_ptr<const decoded_image> image,
                                 std::shared_ptr<const icon_bitmap> bitmap,
                                 decode_error error)
    : record_(record),
      index_(index),
      image_(std::move(image)),
      bitmap_(std::move(bitmap)),
      error_(error) {}

icon_directory::icon_directory(std::uint16_t reserved,
                               std::uint16_t type,
                               std::uint16_t count,
                               std::vector<directory_entry> entries,
                               std::vector<std::shared_ptr<const decoded_image>> images)
    : reserved_(reserved),
      type_(type),
      count_(count),
      entries_(std::move(entries)),
      images_(std::move(images)) {}

resource_type icon_directory::type() const noexcept {
    switch (type_) {
        case 1: return resource_type::icon;
        case 2: return resource_type::cursor;
        default: return resource_type::unknown;
    }
}

} // namespace icodec
