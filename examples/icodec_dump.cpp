#include <icodec/icodec.hpp>

#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <icon_file> [output_dir]\n";
    std::cerr << "Lists the images of an ICO/CUR file and exports them as PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose  Log decoding details\n";
    std::cerr << "  -h, --help     Show this help\n";
}

void print_directory(const icodec::icon_directory& dir) {
    const bool cursor = dir.type() == icodec::resource_type::cursor;

    std::cout << "Type: " << icodec::to_string(dir.type())
              << ", declared images: " << dir.count()
              << ", usable entries: " << dir.entries().size() << "\n";

    for (const auto& entry : dir.entries()) {
        std::cout << "  #" << entry.index() << ": "
                  << entry.pixel_width() << "x" << entry.pixel_height();
        if (cursor) {
            std::cout << ", hotspot (" << entry.hotspot_x() << ", " << entry.hotspot_y() << ")";
        } else {
            std::cout << ", " << entry.bit_count() << " bpp";
        }
        std::cout << ", " << entry.bytes_in_resource() << " bytes at " << entry.image_offset();

        if (const auto* image = entry.image()) {
            std::cout << " -> " << image->width << "x" << image->height
                      << (entry.bitmap() ? " (DIB)" : " (PNG)");
        } else {
            std::cout << " -> not decoded";
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    int arg = 1;
    for (; arg < argc && argv[arg][0] == '-'; ++arg) {
        if (std::strcmp(argv[arg], "-v") == 0 || std::strcmp(argv[arg], "--verbose") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else if (std::strcmp(argv[arg], "-h") == 0 || std::strcmp(argv[arg], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (arg >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(argv[arg]);

    icodec::icon_directory dir;
    auto result = icodec::icon_file::read(input_path, dir);
    if (!result) {
        std::cerr << "Error: " << icodec::to_string(result.error) << ": " << result.message << "\n";
        return 1;
    }

    print_directory(dir);

    if (arg + 1 >= argc) {
        return 0;
    }

    const std::filesystem::path output_dir(argv[arg + 1]);
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << output_dir << ": " << ec.message() << "\n";
        return 1;
    }

    int failures = 0;
    for (const auto& entry : dir.entries()) {
        const auto* image = entry.image();
        if (!image) continue;

        const auto output_path = output_dir /
            (input_path.stem().string() + "_" + std::to_string(entry.index()) + ".png");
        if (!icodec::save_png(*image, output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            ++failures;
            continue;
        }
        std::cout << "Saved: " << output_path << "\n";
    }

    return failures == 0 ? 0 : 1;
}
