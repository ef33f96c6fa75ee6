#ifndef ICODEC_BYTE_SOURCE_HPP_
#define ICODEC_BYTE_SOURCE_HPP_

#include <icodec/icodec_export.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <span>

namespace icodec {

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Forward-only source of bytes.
 *
 * The container reader never seeks, so any stream without random access
 * (pipes, sockets, decompressors) can back a byte_source.
 */
class ICODEC_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Read up to dst.size() bytes.
     * @param dst Destination buffer
     * @return Number of bytes read; less than dst.size() only at end of
     *         stream or on error
     */
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> dst) = 0;

    /**
     * @return true if the last short read was caused by an I/O error
     *         rather than the end of the stream
     */
    [[nodiscard]] virtual bool failed() const noexcept { return false; }
};

// ============================================================================
// Memory Source
// ============================================================================

/**
 * Reads from a caller-owned buffer. The buffer must outlive the source.
 */
class ICODEC_EXPORT memory_source : public byte_source {
public:
    explicit memory_source(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> dst) override;

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Stream Sources
// ============================================================================

/**
 * Reads from a std::istream opened in binary mode. Only get() style
 * reads are used; the stream is never repositioned.
 */
class ICODEC_EXPORT istream_source : public byte_source {
public:
    explicit istream_source(std::istream& in) noexcept
        : in_(in) {}

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> dst) override;
    [[nodiscard]] bool failed() const noexcept override { return in_.bad(); }

private:
    std::istream& in_;
};

/**
 * Opens a file for binary reading.
 */
class ICODEC_EXPORT file_source : public byte_source {
public:
    explicit file_source(const std::filesystem::path& path);

    file_source(const file_source&) = delete;
    file_source& operator=(const file_source&) = delete;

    [[nodiscard]] bool is_open() const { return file_.is_open(); }

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> dst) override;
    [[nodiscard]] bool failed() const noexcept override { return !file_.is_open() || file_.bad(); }

private:
    std::ifstream file_;
};

} // namespace icodec

#endif // ICODEC_BYTE_SOURCE_HPP_
