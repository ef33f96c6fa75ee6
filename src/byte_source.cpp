#include <icodec/byte_source.hpp>

#include <algorithm>
#include <cstring>

namespace icodec {

namespace {

std::size_t read_stream(std::istream& in, std::span<std::uint8_t> dst) {
    if (dst.empty() || !in.good()) {
        return 0;
    }
    in.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    return static_cast<std::size_t>(in.gcount());
}

} // namespace

std::size_t memory_source::read(std::span<std::uint8_t> dst) {
    const std::size_t n = std::min(dst.size(), remaining());
    if (n > 0) {
        std::memcpy(dst.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

std::size_t istream_source::read(std::span<std::uint8_t> dst) {
    return read_stream(in_, dst);
}

file_source::file_source(const std::filesystem::path& path)
    : file_(path, std::ios::binary) {}

std::size_t file_source::read(std::span<std::uint8_t> dst) {
    return read_stream(file_, dst);
}

} // namespace icodec
