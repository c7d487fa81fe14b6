#include <rasterfx/rasterfx.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <filter> <image_file> [output_file]\n";
    std::cerr << "Applies a filter to an image and writes the result as PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list    List available filters and input formats\n";
    std::cerr << "  -h, --help    Show this help\n";
}

void list_filters_and_codecs() {
    std::cout << "Available filters:\n";
    for (const auto kind : rasterfx::all_filter_kinds) {
        std::cout << "  " << rasterfx::to_string(kind) << "\n";
    }

    std::cout << "Input formats:\n";
    for (const auto& decoder : rasterfx::codec_registry::instance().decoders()) {
        std::cout << "  " << decoder->name() << " (";
        bool first = true;
        for (const auto& ext : decoder->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

// An empty file yields an empty vector; only I/O failures yield nullopt
std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }

    const auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return std::nullopt;
    }

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));

    return file.good();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Check for options
    if (std::strcmp(argv[1], "-l") == 0 || std::strcmp(argv[1], "--list") == 0) {
        list_filters_and_codecs();
        return 0;
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string filter_name(argv[1]);
    const std::filesystem::path input_path(argv[2]);

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    const auto data = read_file(input_path);
    if (!data) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    // Empty files go through too; the engine reports them as decode_failed
    auto result = rasterfx::apply_filter(*data, filter_name);
    if (!result) {
        std::cerr << "Error: " << rasterfx::to_string(result.error) << ": "
                  << result.message << "\n";
        return 1;
    }

    std::filesystem::path output_path;
    if (argc >= 4) {
        output_path = argv[3];
    } else {
        output_path = input_path;
        output_path.replace_filename(input_path.stem().string() + "_" + filter_name + ".png");
    }

    if (!write_file(output_path, result.data)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Applied " << filter_name << ", saved: " << output_path << "\n";

    return 0;
}
