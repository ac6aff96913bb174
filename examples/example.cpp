#include <koi/koi.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <raw_pixels> [output]\n";
    std::cerr << "Encodes interleaved RGB/RGBA bytes and checks the round trip.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -3            Input has 3 channels (default 4)\n";
    std::cerr << "  -z, --lz4     Wrap the stream in an LZ4 frame\n";
    std::cerr << "  -h, --help    Show this help\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

} // namespace

int main(int argc, char* argv[]) {
    koi::channels ch = koi::channels::rgba;
    koi::stream_options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-3") == 0) {
            ch = koi::channels::rgb;
        } else if (std::strcmp(argv[i], "-z") == 0 || std::strcmp(argv[i], "--lz4") == 0) {
            options.kind = koi::backend::lz4;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(positional[0]);
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    auto pixels = read_file(input_path);
    if (pixels.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    auto encoded = koi::encode(pixels, ch, options);
    if (!encoded.result) {
        std::cerr << "Error: Failed to encode: " << koi::to_string(encoded.result.error)
                  << ": " << encoded.result.message << "\n";
        return 1;
    }

    const std::uint64_t pixel_count = pixels.size() / koi::channel_count(ch);
    std::cout << "Encoded " << pixel_count << " pixels (" << koi::to_string(options.kind)
              << "): " << pixels.size() << " -> " << encoded.data.size() << " bytes\n";

    auto decoded = koi::decode(encoded.data, pixel_count, ch, options.kind);
    if (!decoded.result) {
        std::cerr << "Error: Failed to decode: " << koi::to_string(decoded.result.error)
                  << ": " << decoded.result.message << "\n";
        return 1;
    }

    if (decoded.pixels != pixels) {
        std::cerr << "Error: Round trip mismatch\n";
        return 1;
    }

    std::cout << "Round trip verified\n";

    if (positional.size() >= 2) {
        const std::filesystem::path output_path(positional[1]);
        std::ofstream file(output_path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(encoded.data.data()),
                   static_cast<std::streamsize>(encoded.data.size()));
        if (!file) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return 1;
        }
        std::cout << "Saved: " << output_path << "\n";
    }

    return 0;
}
