#pragma once

#include <optional>
#include <string>

namespace codeclean {

// Forward declarations
struct Screen;

// Abstract interfaces for dependency injection
class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto display_screen(const Screen& screen) -> void = 0;
    virtual auto read_line() -> std::string = 0;
    virtual auto is_interactive() -> bool = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_text_atomic(const std::string& text, const std::string& path) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto is_likely_binary(const std::string& path) -> bool = 0;
};

} // namespace codeclean
