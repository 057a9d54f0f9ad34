#pragma once

#include "codeclean/core/pipeline.hpp"
#include <optional>
#include <string>
#include <vector>

namespace codeclean {

struct Config {
    std::vector<std::string> files;
    Options options;
    size_t jobs = 0;                    // 0 = one worker per hardware thread
    bool preview = false;               // Print a line diff for every changed file
    bool write = false;                 // Overwrite changed files (after confirmation)
    bool assume_yes = false;
    bool verbose = false;
    bool list_languages = false;
    std::string config_file;
};

// Applies one `key=value` setting. Returns false for unknown keys or bad values.
auto apply_config_entry(const std::string& key, const std::string& value, Config& config) -> bool;

// Reads `key=value` lines ('#' comments and blank lines ignored) into `config`.
// Returns the number of rejected lines, or std::nullopt if the file cannot be read.
auto load_config_file(const std::string& file_path, Config& config) -> std::optional<size_t>;

struct CommandLine {
    Config config;
    bool show_help = false;
    std::string error;                  // Non-empty on a usage error
};

// Settings from --config FILE are applied first, flags override them
auto parse_command_line(const std::vector<std::string>& args) -> CommandLine;

auto usage_text() -> std::string;

} // namespace codeclean
