#pragma once

#include <icodec/byte_source.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace test_helpers {

// Hands out at most chunk bytes per read, like a network channel
class chunked_source : public icodec::byte_source {
public:
    chunked_source(std::span<const std::uint8_t> data, std::size_t chunk)
        : data_(data), chunk_(chunk) {}

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> dst) override {
        const std::size_t n = std::min({dst.size(), chunk_, data_.size() - pos_});
        std::memcpy(dst.data(), data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t chunk_;
    std::size_t pos_ = 0;
};

// Reports an I/O error once limit bytes have been delivered
class failing_source : public icodec::byte_source {
public:
    failing_source(std::span<const std::uint8_t> data, std::size_t limit)
        : data_(data), limit_(std::min(limit, data.size())) {}

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> dst) override {
        const std::size_t n = std::min(dst.size(), limit_ - pos_);
        std::memcpy(dst.data(), data_.data() + pos_, n);
        pos_ += n;
        if (n < dst.size()) {
            failed_ = true;
        }
        return n;
    }

    [[nodiscard]] bool failed() const noexcept override { return failed_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t limit_;
    std::size_t pos_ = 0;
    bool failed_ = false;
};

} // namespace test_helpers
