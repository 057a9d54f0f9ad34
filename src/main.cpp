#include "codeclean/application/codeclean_app.hpp"
#include "codeclean/application/config.hpp"
#include "codeclean/core/language_profile.hpp"
#include "codeclean/io/file_system.hpp"
#include "codeclean/ui/terminal.hpp"
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

auto setup_logging() -> void {
    auto logger = spdlog::stderr_color_mt("codeclean");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);
}

auto list_languages() -> void {
    for (const auto& profile : codeclean::all_profiles()) {
        std::cout << profile.id << ":";
        for (const auto& extension : profile.extensions) {
            std::cout << " " << extension;
        }
        std::cout << '\n';
    }
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    setup_logging();
    std::vector<std::string> args(argv + 1, argv + argc);
    auto command_line = codeclean::parse_command_line(args);

    if (command_line.show_help) {
        std::cout << codeclean::usage_text();
        return 0;
    }
    if (!command_line.error.empty()) {
        std::cerr << "Error: " << command_line.error << "\n\n" << codeclean::usage_text();
        return 2;
    }

    const auto& config = command_line.config;
    spdlog::set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);

    if (config.list_languages) {
        list_languages();
        return 0;
    }

    try {
        codeclean::CodeCleanApp app(std::make_unique<codeclean::Terminal>(),
                                    std::make_unique<codeclean::FileSystem>());
        return app.run(config);
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
}
