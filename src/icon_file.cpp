#include <icodec/icon_file.hpp>
#include <icodec/codec.hpp>
#include <icodec/codecs/png.hpp>
#include <icodec/surface.hpp>
#include "codecs/byte_io.hpp"
#include "codecs/decode_helpers.hpp"
#include "log.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace icodec {

namespace {

// PNG signature 89 50 4E 47 0D 0A 1A 0A, read as two little-endian dwords
constexpr std::uint32_t PNG_MAGIC_1 = 0x474E5089;
constexpr std::uint32_t PNG_MAGIC_2 = 0x0A1A0A0D;
constexpr std::size_t PNG_SIGNATURE_SIZE = 8;

// Compression types
constexpr std::uint32_t BI_RGB = 0;

// 8 bpp with two planes
constexpr std::uint64_t MAX_COLOR_TABLE = 65536;

constexpr std::size_t SKIP_CHUNK_SIZE = 4096;

// ICO/CUR file header
struct ico_header {
    std::uint16_t reserved;   // Must be 0
    std::uint16_t type;       // 1 = ICO, 2 = CUR
    std::uint16_t count;      // Number of images
};

ico_header parse_ico_header(const std::uint8_t* p) {
    ico_header header;
    header.reserved = read_le16(p);
    header.type = read_le16(p + 2);
    header.count = read_le16(p + 4);
    return header;
}

dir_entry_record parse_dir_entry(const std::uint8_t* p) {
    dir_entry_record entry;
    entry.width = p[0];
    entry.height = p[1];
    entry.color_count = p[2];
    entry.reserved = p[3];
    entry.planes = read_le16(p + 4);
    entry.bit_count = read_le16(p + 6);
    entry.bytes_in_resource = read_le32(p + 8);
    entry.image_offset = read_le32(p + 12);
    return entry;
}

bitmap_info_header parse_dib_header(const std::uint8_t* p) {
    bitmap_info_header header;
    header.size = read_le32(p);
    header.width = read_le32_signed(p + 4);
    header.height = read_le32_signed(p + 8);
    header.planes = read_le16(p + 12);
    header.bit_count = read_le16(p + 14);
    header.compression = read_le32(p + 16);
    header.size_image = read_le32(p + 20);
    header.x_pels_per_meter = read_le32_signed(p + 24);
    header.y_pels_per_meter = read_le32_signed(p + 28);
    header.clr_used = read_le32(p + 32);
    header.clr_important = read_le32(p + 36);
    return header;
}

bool is_supported_bit_count(std::uint16_t bit_count) {
    return bit_count == 1 || bit_count == 4 || bit_count == 8 ||
           bit_count == 16 || bit_count == 24 || bit_count == 32;
}

// Scale a 5-bit channel to 8 bits
std::uint8_t expand5(std::uint16_t v) {
    return static_cast<std::uint8_t>((v << 3) | (v >> 2));
}

// Expand the XOR and AND planes of a DIB resource to RGBA
decode_result expand_dib(const icon_bitmap& bmp, int width, int height, decoded_image& out) {
    const int bits = bmp.header.bit_count;
    const std::size_t xs = xor_stride(width, bits);
    const std::size_t as = and_stride(width);

    out.width = width;
    out.height = height;
    out.pixels.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4, 0);

    for (int y = 0; y < height; ++y) {
        // DIB rows are stored bottom-up, for every bit depth
        const auto src_y = static_cast<std::size_t>(height - 1 - y);
        const std::uint8_t* xor_row = bmp.xor_mask.data() + src_y * xs;
        const std::uint8_t* and_row = bmp.and_mask.data() + src_y * as;

        for (int x = 0; x < width; ++x) {
            std::uint8_t r = 0, g = 0, b = 0, a = 0xFF;

            if (bits <= 8) {
                const std::uint8_t idx = extract_pixel(xor_row, x, bits);
                if (idx >= bmp.colors.size()) {
                    return decode_result::failure(decode_error::invalid_format,
                        "Palette index " + std::to_string(idx) + " outside color table of " +
                        std::to_string(bmp.colors.size()));
                }
                const rgb_quad& q = bmp.colors[idx];
                b = q.blue;
                g = q.green;
                r = q.red;
            } else if (bits == 16) {
                // 5-5-5, blue in the low bits
                const std::uint16_t word = read_le16(xor_row + x * 2);
                b = expand5(word & 0x1F);
                g = expand5((word >> 5) & 0x1F);
                r = expand5((word >> 10) & 0x1F);
            } else if (bits == 24) {
                const std::uint8_t* p = xor_row + x * 3;
                b = p[0];
                g = p[1];
                r = p[2];
            } else {
                // 32-bit BGRA, alpha is explicit
                const std::uint8_t* p = xor_row + x * 4;
                b = p[0];
                g = p[1];
                r = p[2];
                a = p[3];
            }

            // AND bit set = transparent
            if (bits != 32 && (and_row[x / 8] & BIT_MASKS[x % 8]) != 0) {
                a = 0;
            }

            const std::size_t dst_idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                         static_cast<std::size_t>(x)) * 4;
            out.pixels[dst_idx + 0] = r;
            out.pixels[dst_idx + 1] = g;
            out.pixels[dst_idx + 2] = b;
            out.pixels[dst_idx + 3] = a;
        }
    }

    return decode_result::success();
}

// Forward-only reader that counts every byte consumed
class block_reader {
public:
    explicit block_reader(byte_source& src) noexcept
        : src_(src) {}

    [[nodiscard]] decode_result read(std::span<std::uint8_t> dst);
    [[nodiscard]] decode_result skip(std::uint64_t count);
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }

private:
    byte_source& src_;
    std::uint64_t offset_ = 0;
};

decode_result block_reader::read(std::span<std::uint8_t> dst) {
    std::size_t got = 0;
    while (got < dst.size()) {
        const std::size_t n = src_.read(dst.subspan(got));
        if (n == 0) {
            break;
        }
        got += n;
    }
    offset_ += got;

    if (got < dst.size()) {
        if (src_.failed()) {
            return decode_result::failure(decode_error::io_error,
                "Read error at offset " + std::to_string(offset_));
        }
        return decode_result::failure(decode_error::truncated_data,
            "Unexpected end of data at offset " + std::to_string(offset_));
    }
    return decode_result::success();
}

decode_result block_reader::skip(std::uint64_t count) {
    std::array<std::uint8_t, SKIP_CHUNK_SIZE> scratch;
    while (count > 0) {
        const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(count, scratch.size()));
        auto result = read(std::span<std::uint8_t>(scratch.data(), n));
        if (!result) {
            return result;
        }
        count -= n;
    }
    return decode_result::success();
}

// Directory record collecting its resource during the pass
struct pending_entry {
    dir_entry_record record;
    std::uint16_t index = 0;
    std::shared_ptr<const decoded_image> image;
    std::shared_ptr<const icon_bitmap> bitmap;
    decode_error error = decode_error::none;
};

class container_parser {
public:
    container_parser(byte_source& src, const decode_options& options)
        : in_(src), options_(options) {
        std::tie(max_w_, max_h_) = get_dimension_limits(options, DEFAULT_ICON_MAX_DIMENSION);
    }

    [[nodiscard]] decode_result parse(icon_directory& dir);

private:
    decode_result read_directory(std::uint16_t count);
    pending_entry* claim_entry(std::uint64_t offset);
    std::optional<std::uint64_t> next_pending_offset(std::uint64_t offset) const;

    decode_result decode_block();
    decode_result decode_dib(std::uint32_t header_size);
    decode_result decode_png(const std::array<std::uint8_t, PNG_SIGNATURE_SIZE>& signature);
    decode_result decode_png_payload(std::span<const std::uint8_t> data, decoded_image& image) const;

    decode_result reject_block(decode_error error, const std::string& reason);
    decode_result skip_orphan(const std::string& reason);
    decode_result skip_to_resource_end();
    decode_result block_read_failed(decode_result result);

    block_reader in_;
    const decode_options& options_;
    int max_w_ = 0;
    int max_h_ = 0;

    std::vector<pending_entry> entries_;
    std::vector<pending_entry*> pending_;

    // State of the block being decoded
    std::uint64_t block_start_ = 0;
    pending_entry* owner_ = nullptr;
    bool stop_ = false;
    bool resumed_ = false;
};

decode_result container_parser::parse(icon_directory& dir) {
    std::array<std::uint8_t, icon_file::header_size> raw{};
    auto result = in_.read(raw);
    if (!result) {
        return result;
    }

    const ico_header header = parse_ico_header(raw.data());
    if (header.reserved != 0) {
        return decode_result::failure(decode_error::invalid_header,
            "ICO reserved word is " + std::to_string(header.reserved) + ", expected 0");
    }
    if (header.type != 1 && header.type != 2) {
        return decode_result::failure(decode_error::unsupported_resource_type,
            "ICO resource type " + std::to_string(header.type) + " is neither icon nor cursor");
    }

    logger().debug("ICO: type={}, {} images", header.type == 2 ? "CUR" : "ICO", header.count);

    result = read_directory(header.count);
    if (!result) {
        return result;
    }

    pending_.reserve(entries_.size());
    for (auto& entry : entries_) {
        pending_.push_back(&entry);
    }

    // A skipped orphan does not count as a visited block; the next
    // iteration always claims the entry the stream resumed at
    for (std::uint16_t block = 0; block < header.count && !stop_ && !pending_.empty();) {
        const std::uint64_t offset = in_.offset();
        const bool reachable = std::any_of(pending_.begin(), pending_.end(),
            [offset](const pending_entry* e) { return e->record.image_offset >= offset; });
        if (!reachable) {
            logger().warn("ICO: {} image(s) start before offset {} and cannot be read from a forward-only stream",
                       pending_.size(), offset);
            break;
        }

        resumed_ = false;
        result = decode_block();
        if (!result) {
            return result;
        }
        if (!resumed_) {
            ++block;
        }
    }

    std::vector<directory_entry> entries;
    entries.reserve(entries_.size());
    std::vector<std::shared_ptr<const decoded_image>> images(header.count);
    for (const auto& entry : entries_) {
        images[entry.index] = entry.image;
        entries.emplace_back(entry.record, entry.index, entry.image, entry.bitmap, entry.error);
    }

    dir = icon_directory(header.reserved, header.type, header.count,
                         std::move(entries), std::move(images));
    return decode_result::success();
}

decode_result container_parser::read_directory(std::uint16_t count) {
    entries_.reserve(count);

    std::array<std::uint8_t, icon_file::dir_entry_size> raw{};
    for (std::uint16_t i = 0; i < count; ++i) {
        auto result = in_.read(raw);
        if (!result) {
            return result;
        }

        const dir_entry_record record = parse_dir_entry(raw.data());
        if (record.reserved != 0) {
            logger().debug("ICO: dropping entry {} with reserved byte {}", i, record.reserved);
            continue;
        }

        pending_entry entry;
        entry.record = record;
        entry.index = i;
        entries_.push_back(std::move(entry));
    }

    return decode_result::success();
}

// Removes and returns the first unclaimed entry whose image starts at offset
pending_entry* container_parser::claim_entry(std::uint64_t offset) {
    auto it = std::find_if(pending_.begin(), pending_.end(),
        [offset](const pending_entry* e) { return e->record.image_offset == offset; });
    if (it == pending_.end()) {
        return nullptr;
    }
    pending_entry* entry = *it;
    pending_.erase(it);
    return entry;
}

// Smallest pending image offset at or after offset
std::optional<std::uint64_t> container_parser::next_pending_offset(std::uint64_t offset) const {
    std::optional<std::uint64_t> next;
    for (const pending_entry* e : pending_) {
        if (e->record.image_offset >= offset && (!next || e->record.image_offset < *next)) {
            next = e->record.image_offset;
        }
    }
    return next;
}

decode_result container_parser::decode_block() {
    block_start_ = in_.offset();
    owner_ = claim_entry(block_start_);

    // A gap too small to hold a bitmap header is padding before the next resource
    if (!owner_) {
        const auto next = next_pending_offset(block_start_);
        if (next && *next - block_start_ < icon_file::bitmap_info_header_size) {
            logger().debug("ICO: skipping {} bytes of padding at offset {}", *next - block_start_, block_start_);
            auto skipped = in_.skip(*next - block_start_);
            if (!skipped) {
                return block_read_failed(std::move(skipped));
            }
            block_start_ = in_.offset();
            owner_ = claim_entry(block_start_);
        }
    }

    if (owner_) {
        logger().debug("ICO: block at offset {} is image {}", block_start_, owner_->index);
    } else {
        logger().debug("ICO: no entry claims offset {}, decoding without attaching", block_start_);
    }

    std::array<std::uint8_t, PNG_SIGNATURE_SIZE> magic{};
    auto result = in_.read(std::span<std::uint8_t>(magic.data(), 4));
    if (!result) {
        return block_read_failed(std::move(result));
    }

    const std::uint32_t size = read_le32(magic.data());
    if (size == icon_file::bitmap_info_header_size) {
        return decode_dib(size);
    }

    if (size == PNG_MAGIC_1) {
        result = in_.read(std::span<std::uint8_t>(magic.data() + 4, 4));
        if (!result) {
            return block_read_failed(std::move(result));
        }
        if (read_le32(magic.data() + 4) == PNG_MAGIC_2) {
            return decode_png(magic);
        }
        return reject_block(decode_error::invalid_format, "incomplete PNG signature");
    }

    return reject_block(decode_error::invalid_format, "unrecognized bitmap header size " + std::to_string(size));
}

decode_result container_parser::decode_dib(std::uint32_t header_size) {
    std::array<std::uint8_t, icon_file::bitmap_info_header_size> raw{};
    write_le32(raw.data(), header_size);
    auto result = in_.read(std::span<std::uint8_t>(raw).subspan(4));
    if (!result) {
        return block_read_failed(std::move(result));
    }

    auto bitmap = std::make_shared<icon_bitmap>();
    bitmap->header = parse_dib_header(raw.data());
    const bitmap_info_header& header = bitmap->header;

    logger().debug("ICO: DIB {}x{}, planes={}, bpp={}, compression={}",
                header.width, header.height, header.planes, header.bit_count, header.compression);

    if (header.compression != BI_RGB) {
        return reject_block(decode_error::unsupported_encoding,
                            "compression " + std::to_string(header.compression) + " not supported");
    }
    if (!is_supported_bit_count(header.bit_count)) {
        return reject_block(decode_error::unsupported_bit_depth,
                            "unsupported bit count " + std::to_string(header.bit_count));
    }

    // Height covers the XOR and AND planes
    const std::int64_t abs_height = std::abs(static_cast<std::int64_t>(header.height));
    if (header.width <= 0 || abs_height < 2 || (abs_height % 2) != 0) {
        return reject_block(decode_error::invalid_format,
                            "invalid dimensions " + std::to_string(header.width) + "x" +
                            std::to_string(header.height));
    }

    const int width = header.width;
    const auto height = static_cast<int>(abs_height / 2);
    if (width > max_w_ || height > max_h_) {
        return reject_block(decode_error::dimensions_exceeded,
                            "dimensions " + std::to_string(width) + "x" + std::to_string(height) +
                            " exceed limits");
    }

    const std::uint64_t colors = resolve_color_count(owner_ ? owner_->record.color_count : 0,
                                                     header.planes, header.bit_count);
    if (colors > MAX_COLOR_TABLE) {
        return reject_block(decode_error::unsupported_bit_depth,
                            "color table of " + std::to_string(colors) + " entries");
    }

    if (colors > 0) {
        std::vector<std::uint8_t> table(static_cast<std::size_t>(colors) * 4);
        result = in_.read(table);
        if (!result) {
            return block_read_failed(std::move(result));
        }

        bitmap->colors.resize(static_cast<std::size_t>(colors));
        for (std::size_t i = 0; i < bitmap->colors.size(); ++i) {
            const std::uint8_t* p = table.data() + i * 4;
            bitmap->colors[i] = rgb_quad{p[0], p[1], p[2], p[3]};
        }
    }

    bitmap->xor_mask.resize(xor_stride(width, header.bit_count) * static_cast<std::size_t>(height));
    bitmap->and_mask.resize(and_stride(width) * static_cast<std::size_t>(height));

    result = in_.read(bitmap->xor_mask);
    if (!result) {
        return block_read_failed(std::move(result));
    }
    result = in_.read(bitmap->and_mask);
    if (!result) {
        return block_read_failed(std::move(result));
    }

    auto image = std::make_shared<decoded_image>();
    result = expand_dib(*bitmap, width, height, *image);
    if (!result) {
        // Block fully consumed; only the slot stays empty
        logger().warn("ICO: DIB at offset {} not decoded: {}", block_start_, result.message);
        if (owner_) {
            owner_->error = result.error;
        }
        return skip_to_resource_end();
    }

    if (owner_) {
        owner_->image = std::move(image);
        owner_->bitmap = std::move(bitmap);
    }

    return skip_to_resource_end();
}

decode_result container_parser::decode_png(const std::array<std::uint8_t, PNG_SIGNATURE_SIZE>& signature) {
    if (!owner_) {
        return skip_orphan("PNG block has no known length");
    }

    const std::uint32_t declared = owner_->record.bytes_in_resource;
    if (declared < PNG_SIGNATURE_SIZE) {
        return reject_block(decode_error::invalid_format, "PNG resource of " + std::to_string(declared) + " bytes");
    }
    if (declared > options_.max_resource_size) {
        return reject_block(decode_error::dimensions_exceeded,
                            "PNG resource of " + std::to_string(declared) + " bytes exceeds limit");
    }

    std::vector<std::uint8_t> buffer(declared);
    std::copy(signature.begin(), signature.end(), buffer.begin());
    auto result = in_.read(std::span<std::uint8_t>(buffer).subspan(PNG_SIGNATURE_SIZE));
    if (!result) {
        return block_read_failed(std::move(result));
    }

    auto image = std::make_shared<decoded_image>();
    result = decode_png_payload(buffer, *image);
    if (!result) {
        logger().warn("ICO: PNG image {} not decoded: {}", owner_->index, result.message);
        owner_->error = result.error;
        return decode_result::success();
    }

    owner_->image = std::move(image);
    return decode_result::success();
}

decode_result container_parser::decode_png_payload(std::span<const std::uint8_t> data,
                                                   decoded_image& image) const {
    // Pass dimension limits to prevent large allocations
    decode_options png_opts;
    png_opts.max_width = max_w_;
    png_opts.max_height = max_h_;

    memory_surface temp;
    auto result = options_.png_delegate
        ? options_.png_delegate->decode(data, temp, png_opts)
        : png_decoder::decode(data, temp, png_opts);
    if (!result) {
        return result;
    }
    if (temp.width() <= 0 || temp.height() <= 0) {
        return decode_result::failure(decode_error::invalid_format, "PNG decoder produced no pixels");
    }

    image.width = temp.width();
    image.height = temp.height();
    image.pixels.resize(static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height) * 4);

    auto src = temp.pixels();
    if (temp.format() == pixel_format::rgba8888) {
        std::memcpy(image.pixels.data(), src.data(), image.pixels.size());
    } else {
        for (std::size_t i = 0; i < image.pixels.size() / 4; ++i) {
            image.pixels[i * 4 + 0] = src[i * 3 + 0];
            image.pixels[i * 4 + 1] = src[i * 3 + 1];
            image.pixels[i * 4 + 2] = src[i * 3 + 2];
            image.pixels[i * 4 + 3] = 0xFF;
        }
    }

    return decode_result::success();
}

// Resource cannot be decoded. The owning entry tells where it ends.
decode_result container_parser::reject_block(decode_error error, const std::string& reason) {
    if (!owner_) {
        return skip_orphan(reason);
    }

    logger().warn("ICO: image {} at offset {} skipped: {}", owner_->index, block_start_, reason);
    owner_->error = error;
    return skip_to_resource_end();
}

// An orphaned block has no known end. Resume at the next resource still
// ahead of the stream, or stop when there is none.
decode_result container_parser::skip_orphan(const std::string& reason) {
    const auto next = next_pending_offset(in_.offset());
    if (!next) {
        logger().warn("ICO: orphaned block at offset {}: {}, stopping", block_start_, reason);
        stop_ = true;
        return decode_result::success();
    }

    logger().warn("ICO: orphaned block at offset {}: {}, resuming at offset {}", block_start_, reason, *next);
    auto result = in_.skip(*next - in_.offset());
    if (!result) {
        return block_read_failed(std::move(result));
    }
    resumed_ = true;
    return decode_result::success();
}

decode_result container_parser::skip_to_resource_end() {
    if (!owner_) {
        return decode_result::success();
    }

    const std::uint64_t consumed = in_.offset() - block_start_;
    const std::uint64_t declared = owner_->record.bytes_in_resource;
    if (consumed >= declared) {
        return decode_result::success();
    }

    auto result = in_.skip(declared - consumed);
    if (!result) {
        return block_read_failed(std::move(result));
    }
    return decode_result::success();
}

// End of data inside a block ends the pass; I/O errors are fatal
decode_result container_parser::block_read_failed(decode_result result) {
    if (result.error == decode_error::io_error) {
        return result;
    }

    logger().warn("ICO: block at offset {} cut short: {}", block_start_, result.message);
    if (owner_) {
        owner_->error = result.error;
    }
    stop_ = true;
    return decode_result::success();
}

} // namespace

// ============================================================================
// ICO/CUR Container Reader
// ============================================================================

decode_result icon_file::read(byte_source& src,
                              icon_directory& dir,
                              const decode_options& options) {
    container_parser parser(src, options);
    return parser.parse(dir);
}

decode_result icon_file::read(std::span<const std::uint8_t> data,
                              icon_directory& dir,
                              const decode_options& options) {
    memory_source src(data);
    return read(src, dir, options);
}

decode_result icon_file::read(const std::filesystem::path& path,
                              icon_directory& dir,
                              const decode_options& options) {
    file_source src(path);
    if (!src.is_open()) {
        return decode_result::failure(decode_error::io_error,
            "Cannot open " + path.string());
    }
    return read(src, dir, options);
}

// ============================================================================
// DIB Layout Helpers
// ============================================================================

std::uint64_t resolve_color_count(std::uint8_t entry_color_count,
                                  std::uint16_t planes,
                                  std::uint16_t bit_count) noexcept {
    if (entry_color_count != 0) {
        return entry_color_count;
    }

    if (planes == 1) {
        switch (bit_count) {
            case 1: return 2;
            case 4: return 16;
            case 8: return 256;
            default: return 0;  // True color, no table
        }
    }

    const std::uint64_t bits = static_cast<std::uint64_t>(bit_count) * planes;
    if (bits >= 64) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return std::uint64_t{1} << bits;
}

std::size_t xor_stride(int width, int bit_count) noexcept {
    if (width <= 0 || bit_count <= 0) {
        return 0;
    }
    return row_stride_4byte(width, bit_count);
}

std::size_t and_stride(int width) noexcept {
    if (width <= 0) {
        return 0;
    }
    return row_stride_4byte(width, 1);
}

} // namespace icodec
