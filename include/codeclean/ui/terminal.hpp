#pragma once

#include "codeclean/interfaces.hpp"
#include "codeclean/ui/screen.hpp"
#include <cstdio>

namespace codeclean {

class Terminal : public ITerminal {
private:
    FILE* tty_file_ = nullptr;          // /dev/tty when stdin is piped
    bool use_tty_ = false;
    bool color_ = false;

public:
    Terminal();
    ~Terminal() override;

    // Delete copy operations to prevent double fclose
    Terminal(const Terminal&) = delete;
    auto operator=(const Terminal&) -> Terminal& = delete;

    // ITerminal interface
    auto display_screen(const Screen& screen) -> void override;
    auto read_line() -> std::string override;
    auto is_interactive() -> bool override;

private:
    auto style_prefix(LineStyle style) const -> std::string;
};

} // namespace codeclean
