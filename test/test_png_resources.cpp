#include <doctest/doctest.h>
#include <icodec/icodec.hpp>

#include "helpers/ico_builder.hpp"

#include <lodepng.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

using namespace test_helpers;

namespace {

// RGBA image whose pixel (x, y) is (x * 40, y * 80, 0x33, 0xC0 + x)
std::vector<std::uint8_t> make_png(unsigned width, unsigned height) {
    std::vector<unsigned char> rgba;
    rgba.reserve(static_cast<std::size_t>(width) * height * 4);
    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            rgba.push_back(static_cast<unsigned char>(x * 40));
            rgba.push_back(static_cast<unsigned char>(y * 80));
            rgba.push_back(0x33);
            rgba.push_back(static_cast<unsigned char>(0xC0 + x));
        }
    }

    std::vector<unsigned char> png;
    const unsigned error = lodepng::encode(png, rgba, width, height);
    REQUIRE(error == 0);
    return png;
}

icodec::decode_result read_icon(const std::vector<std::uint8_t>& data,
                                icodec::icon_directory& dir,
                                const icodec::decode_options& options = {}) {
    icodec::memory_source src{std::span<const std::uint8_t>(data)};
    return icodec::icon_file::read(src, dir, options);
}

// Produces a 1x1 opaque red RGB image for any input
class solid_decoder : public icodec::decoder {
public:
    mutable int calls = 0;

    [[nodiscard]] std::string_view name() const noexcept override { return "solid"; }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return {};
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t>) const noexcept override { return true; }

    [[nodiscard]] icodec::decode_result decode(std::span<const std::uint8_t> data,
                                               icodec::surface& surf,
                                               const icodec::decode_options&) const override {
        ++calls;
        last_size = data.size();
        if (!surf.set_size(1, 1, icodec::pixel_format::rgb888)) {
            return icodec::decode_result::failure(icodec::decode_error::internal_error, "alloc");
        }
        const std::uint8_t red[3] = {0xFF, 0x00, 0x00};
        surf.write_pixels(0, 0, 3, red);
        return icodec::decode_result::success();
    }

    mutable std::size_t last_size = 0;
};

// Reports success without producing an image
class silent_decoder : public icodec::decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "silent"; }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return {};
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t>) const noexcept override { return true; }

    [[nodiscard]] icodec::decode_result decode(std::span<const std::uint8_t>,
                                               icodec::surface&,
                                               const icodec::decode_options&) const override {
        return icodec::decode_result::success();
    }
};

} // namespace

// ============================================================================
// PNG Resources
// ============================================================================

TEST_CASE("PNG resource: decoded to RGBA") {
    auto png = make_png(3, 2);
    auto data = ico_builder().add(png_resource(png, 3, 2)).build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);

    const auto* image = dir.image(0);
    REQUIRE(image != nullptr);
    CHECK(image->width == 3);
    CHECK(image->height == 2);
    CHECK(image->argb(0, 0) == 0xC0000033);
    CHECK(image->argb(2, 0) == 0xC2500033);
    CHECK(image->argb(1, 1) == 0xC1285033);

    // No DIB structures for PNG resources
    CHECK(dir.entries()[0].bitmap() == nullptr);
    CHECK(dir.entries()[0].bytes_in_resource() == png.size());
}

TEST_CASE("PNG resource: 256 pixel entry next to a DIB entry") {
    auto png = make_png(4, 4);
    auto data = ico_builder()
        .add(dib_resource(blank_dib(2, 2, 1), 2))
        .add(png_resource(png, 0, 0))
        .build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);
    REQUIRE(dir.image(0) != nullptr);
    REQUIRE(dir.image(1) != nullptr);
    CHECK(dir.entries()[1].pixel_width() == 256);
    CHECK(dir.image(1)->width == 4);
}

TEST_CASE("PNG resource: corrupt payload leaves only its slot empty") {
    auto png = make_png(3, 3);
    png.resize(30);

    auto data = ico_builder()
        .add(png_resource(png, 3, 3))
        .add(dib_resource(blank_dib(2, 2, 24), 0))
        .build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);
    CHECK(dir.entries().size() == 2);
    CHECK(dir.image(0) == nullptr);
    CHECK(dir.entries()[0].error() == icodec::decode_error::invalid_format);
    REQUIRE(dir.image(1) != nullptr);
    CHECK(dir.image(1)->width == 2);
}

TEST_CASE("PNG resource: incomplete signature is skipped") {
    resource bad;
    bad.width = 1;
    bad.height = 1;
    bad.data = {0x89, 0x50, 0x4E, 0x47, 0x00, 0x00, 0x00, 0x00, 0xAB, 0xCD};

    auto data = ico_builder()
        .add(bad)
        .add(dib_resource(blank_dib(2, 2, 24), 0))
        .build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);
    CHECK(dir.image(0) == nullptr);
    CHECK(dir.image(1) != nullptr);
}

TEST_CASE("PNG resource: size limits") {
    auto png = make_png(2, 2);

    SUBCASE("Larger than max_resource_size") {
        auto data = ico_builder()
            .add(png_resource(png, 2, 2))
            .add(dib_resource(blank_dib(1, 1, 24), 0))
            .build();

        icodec::decode_options options;
        options.max_resource_size = png.size() - 1;

        icodec::icon_directory dir;
        REQUIRE(read_icon(data, dir, options).ok);
        CHECK(dir.image(0) == nullptr);
        CHECK(dir.image(1) != nullptr);
    }

    SUBCASE("Declared length shorter than a signature") {
        auto res = png_resource(png, 2, 2);
        res.bytes_in_resource = 4;
        auto data = ico_builder().add(res).build();

        icodec::icon_directory dir;
        REQUIRE(read_icon(data, dir).ok);
        CHECK(dir.image(0) == nullptr);
    }

    SUBCASE("Pixel dimensions above the limit") {
        auto data = ico_builder().add(png_resource(png, 2, 2)).build();

        icodec::decode_options options;
        options.max_width = 1;

        icodec::icon_directory dir;
        REQUIRE(read_icon(data, dir, options).ok);
        CHECK(dir.image(0) == nullptr);
    }
}

TEST_CASE("PNG resource: orphaned PNG block is skipped to the next resource") {
    auto dropped = png_resource(make_png(2, 2), 2, 2);
    dropped.reserved = 9;

    auto data = ico_builder()
        .add(dropped)
        .add(dib_resource(blank_dib(2, 2, 24), 0))
        .build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);
    REQUIRE(dir.entries().size() == 1);
    CHECK(dir.entries()[0].index() == 1);
    CHECK(dir.image(0) == nullptr);
    REQUIRE(dir.image(1) != nullptr);
    CHECK(dir.image(1)->width == 2);
}

TEST_CASE("PNG resource: custom PNG decoder") {
    auto png = make_png(2, 2);
    auto data = ico_builder()
        .add(png_resource(png, 2, 2))
        .add(dib_resource(blank_dib(1, 1, 24), 0))
        .build();

    solid_decoder delegate;
    icodec::decode_options options;
    options.png_delegate = &delegate;

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir, options).ok);

    // Delegate sees the whole resource, signature included
    CHECK(delegate.calls == 1);
    CHECK(delegate.last_size == png.size());

    const auto* image = dir.image(0);
    REQUIRE(image != nullptr);
    CHECK(image->width == 1);
    CHECK(image->argb(0, 0) == 0xFFFF0000);

    // DIB entries do not go through the delegate
    CHECK(dir.image(1) != nullptr);
}

// ============================================================================
// PNG Codec
// ============================================================================

TEST_CASE("PNG decoder: sniff and decode") {
    auto png = make_png(3, 2);
    CHECK(icodec::png_decoder::sniff(png));

    icodec::memory_surface surface;
    REQUIRE(icodec::png_decoder::decode(png, surface).ok);
    CHECK(surface.width() == 3);
    CHECK(surface.height() == 2);
    CHECK(surface.format() == icodec::pixel_format::rgba8888);

    std::vector<std::uint8_t> not_png = {0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00};
    CHECK_FALSE(icodec::png_decoder::sniff(not_png));
    CHECK_FALSE(icodec::png_decoder::decode(not_png, surface).ok);
}

TEST_CASE("PNG encoder: decoded icon round trip") {
    auto data = ico_builder().add(png_resource(make_png(3, 2), 3, 2)).build();

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir).ok);
    REQUIRE(dir.image(0) != nullptr);

    auto encoded = icodec::encode_png(*dir.image(0));
    REQUIRE_FALSE(encoded.empty());

    icodec::memory_surface surface;
    REQUIRE(icodec::png_decoder::decode(encoded, surface).ok);
    CHECK(surface.width() == 3);
    const auto pixels = surface.pixels();
    CHECK(std::vector<std::uint8_t>(pixels.begin(), pixels.end()) == dir.image(0)->pixels);

    icodec::decoded_image empty;
    CHECK(icodec::encode_png(empty).empty());
}

TEST_CASE("PNG resource: custom decoder that produces no pixels") {
    auto data = ico_builder()
        .add(png_resource(make_png(2, 2), 2, 2))
        .add(dib_resource(blank_dib(1, 1, 24), 0))
        .build();

    silent_decoder delegate;
    icodec::decode_options options;
    options.png_delegate = &delegate;

    icodec::icon_directory dir;
    REQUIRE(read_icon(data, dir, options).ok);
    CHECK(dir.image(0) == nullptr);
    CHECK(dir.entries()[0].error() == icodec::decode_error::invalid_format);
    CHECK(dir.image(1) != nullptr);
}
