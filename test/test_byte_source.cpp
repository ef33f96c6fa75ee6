#include <doctest/doctest.h>
#include <icodec/icodec.hpp>

#include "helpers/ico_builder.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

std::filesystem::path write_temp_file(const std::string& name, const std::vector<std::uint8_t>& data) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
}

} // namespace

// ============================================================================
// Byte Sources
// ============================================================================

TEST_CASE("memory_source: reads until exhausted") {
    const std::vector<std::uint8_t> data = {1, 2, 3, 4, 5};
    icodec::memory_source src{std::span<const std::uint8_t>(data)};

    std::array<std::uint8_t, 3> buf{};
    CHECK(src.read(buf) == 3);
    CHECK(buf[0] == 1);
    CHECK(buf[2] == 3);
    CHECK(src.remaining() == 2);

    CHECK(src.read(buf) == 2);
    CHECK(buf[0] == 4);
    CHECK(buf[1] == 5);
    CHECK(src.read(buf) == 0);
    CHECK_FALSE(src.failed());
}

TEST_CASE("istream_source: reads a binary stream") {
    const std::string bytes("\x00\x01\xFF\x7F", 4);
    std::istringstream in(bytes, std::ios::binary);
    icodec::istream_source src(in);

    std::array<std::uint8_t, 8> buf{};
    CHECK(src.read(buf) == 4);
    CHECK(buf[2] == 0xFF);
    CHECK(src.read(buf) == 0);
    CHECK_FALSE(src.failed());
}

TEST_CASE("istream_source: container from a stream") {
    auto data = ico_builder()
        .add(dib_resource(blank_dib(2, 2, 24), 0))
        .add(dib_resource(blank_dib(3, 3, 8), 0))
        .build();

    std::istringstream in(std::string(data.begin(), data.end()), std::ios::binary);
    icodec::istream_source src(in);

    icodec::icon_directory dir;
    REQUIRE(icodec::icon_file::read(src, dir).ok);
    CHECK(dir.image(0) != nullptr);
    CHECK(dir.image(1) != nullptr);
}

TEST_CASE("file_source: container from disk") {
    auto data = ico_builder(2)
        .add(dib_resource(blank_dib(4, 4, 4), 16))
        .build();
    const auto path = write_temp_file("icodec_test_cursor.cur", data);

    SUBCASE("Through a file_source") {
        icodec::file_source src(path);
        REQUIRE(src.is_open());

        icodec::icon_directory dir;
        REQUIRE(icodec::icon_file::read(src, dir).ok);
        CHECK(dir.type() == icodec::resource_type::cursor);
        REQUIRE(dir.image(0) != nullptr);
        CHECK(dir.image(0)->width == 4);
    }

    SUBCASE("Through a path") {
        icodec::icon_directory dir;
        REQUIRE(icodec::icon_file::read(path, dir).ok);
        CHECK(dir.entries().size() == 1);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("file_source: missing file") {
    const auto path = std::filesystem::temp_directory_path() / "icodec_test_does_not_exist.ico";
    icodec::file_source src(path);
    CHECK_FALSE(src.is_open());
    CHECK(src.failed());

    std::array<std::uint8_t, 4> buf{};
    CHECK(src.read(buf) == 0);
}
