#include "codeclean/io/file_system.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace codeclean {

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    // Binary mode keeps CR bytes for the EOL normalizer
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

auto FileSystem::write_text_atomic(const std::string& text, const std::string& path) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }

            file << text;
            file.flush();
            if (file.fail()) {
                file.close();
                std::filesystem::remove(temp_path);
                return false;
            }
        } // File automatically closed here

        // Atomically replace original file
        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::is_likely_binary(const std::string& path) -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::string sample(BINARY_SNIFF_BYTES, '\0');
    file.read(sample.data(), static_cast<std::streamsize>(sample.size()));
    sample.resize(static_cast<size_t>(file.gcount()));
    return looks_binary(sample);
}

auto looks_binary(const std::string& sample) -> bool {
    if (sample.empty()) {
        return false;
    }
    if (sample.find('\0') != std::string::npos) {
        return true;
    }

    auto nontext = std::count_if(sample.begin(), sample.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80 || (byte >= 32 && byte < 127)) {
            return false;
        }
        return byte != '\n' && byte != '\r' && byte != '\t' && byte != '\f' && byte != '\b';
    });

    return static_cast<double>(nontext) / static_cast<double>(sample.size())
           > FileSystem::BINARY_NONTEXT_RATIO;
}

} // namespace codeclean
