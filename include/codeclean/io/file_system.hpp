#pragma once

#include "codeclean/interfaces.hpp"
#include <string>

namespace codeclean {

class FileSystem : public IFileSystem {
public:
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto write_text_atomic(const std::string& text, const std::string& path) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto is_likely_binary(const std::string& path) -> bool override;

    static constexpr size_t BINARY_SNIFF_BYTES = 1024;
    static constexpr double BINARY_NONTEXT_RATIO = 0.3;
};

// NUL byte, or more than 30% control bytes other than common whitespace.
// Bytes >= 0x80 count as text so UTF-8 sources are not mistaken for binary.
auto looks_binary(const std::string& sample) -> bool;

} // namespace codeclean
