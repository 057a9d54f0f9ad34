#include "codeclean/ui/terminal.hpp"
#include <iostream>
#include <unistd.h>

namespace codeclean {

Terminal::Terminal() : color_(isatty(STDOUT_FILENO) != 0) {
    // Try to open /dev/tty so confirmation prompts work with piped input
    if (!isatty(STDIN_FILENO)) {
        tty_file_ = fopen("/dev/tty", "r");
        if (tty_file_) {
            use_tty_ = true;
        }
    }
}

Terminal::~Terminal() {
    if (tty_file_) {
        fclose(tty_file_);
        tty_file_ = nullptr;
    }
}

auto Terminal::display_screen(const Screen& screen) -> void {
    for (const auto& line : screen.content) {
        std::cout << style_prefix(line.style) << line.text;
        if (color_ && line.style != LineStyle::PLAIN) {
            std::cout << "\033[0m"; // Reset
        }
        std::cout << '\n';
    }

    if (!screen.status_line.empty()) {
        std::cout << screen.status_line << '\n';
    }
    std::cout.flush();
}

auto Terminal::style_prefix(LineStyle style) const -> std::string {
    switch (style) {
    case LineStyle::PLAIN:
        return "  ";
    case LineStyle::HEADER:
        return color_ ? "\033[1;36m" : "";  // Bold cyan
    case LineStyle::REMOVED:
        return color_ ? "\033[31m- " : "- "; // Red
    case LineStyle::ADDED:
        return color_ ? "\033[32m+ " : "+ "; // Green
    }
    return "";
}

auto Terminal::read_line() -> std::string {
    std::string line;

    if (use_tty_) {
        int ch = 0;
        while ((ch = fgetc(tty_file_)) != EOF && ch != '\n') {
            if (ch != '\r') {
                line += static_cast<char>(ch);
            }
        }
    } else {
        std::getline(std::cin, line);
    }

    return line;
}

auto Terminal::is_interactive() -> bool { return isatty(STDIN_FILENO) || (use_tty_ && tty_file_); }

} // namespace codeclean
