#include "codeclean/application/config.hpp"
#include "codeclean/string_utils.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace codeclean {

namespace {

auto parse_bool(const std::string& text) -> std::optional<bool> {
    auto value = StringUtils::to_lowercase(StringUtils::trim(text));
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}

auto parse_count(const std::string& text) -> std::optional<size_t> {
    auto value = StringUtils::trim(text);
    size_t result = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || end != value.data() + value.size() || value.empty()) {
        return std::nullopt;
    }
    return result;
}

} // namespace

auto apply_config_entry(const std::string& key, const std::string& value, Config& config)
    -> bool {
    auto name = StringUtils::to_lowercase(StringUtils::trim(key));

    if (name == "remove_comments" || name == "remove_blank_lines" || name == "preview") {
        auto flag = parse_bool(value);
        if (!flag) {
            return false;
        }
        if (name == "remove_comments") {
            config.options.remove_comments = *flag;
        } else if (name == "remove_blank_lines") {
            config.options.remove_extra_blank_lines = *flag;
        } else {
            config.preview = *flag;
        }
        return true;
    }

    if (name == "eol") {
        auto target = parse_eol_target(value);
        if (!target) {
            return false;
        }
        config.options.eol_target = *target;
        return true;
    }

    if (name == "jobs") {
        auto jobs = parse_count(value);
        if (!jobs) {
            return false;
        }
        config.jobs = *jobs;
        return true;
    }

    if (name == "language") {
        config.options.language_override = StringUtils::trim(value);
        return true;
    }

    return false;
}

auto load_config_file(const std::string& file_path, Config& config) -> std::optional<size_t> {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    size_t rejected = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(file, line)) {
        ++line_number;
        auto trimmed = StringUtils::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        // Parse: key=value (first '=' splits)
        auto equals_pos = trimmed.find('=');
        if (equals_pos == std::string::npos
            || !apply_config_entry(trimmed.substr(0, equals_pos), trimmed.substr(equals_pos + 1),
                                   config)) {
            spdlog::warn("{}:{}: ignoring invalid setting '{}'", file_path, line_number, trimmed);
            ++rejected;
        }
    }

    return rejected;
}

auto parse_command_line(const std::vector<std::string>& args) -> CommandLine {
    CommandLine result;
    auto& config = result.config;

    // First pass: the config file provides the defaults
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config.config_file = args[i + 1];
        }
    }
    if (!config.config_file.empty() && !load_config_file(config.config_file, config)) {
        result.error = "cannot read config file " + config.config_file;
        return result;
    }

    auto needs_value = [&](size_t i) {
        if (i + 1 >= args.size()) {
            result.error = "option " + args[i] + " requires a value";
            return false;
        }
        return true;
    };

    for (size_t i = 0; i < args.size() && result.error.empty(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
        } else if (arg == "--keep-comments") {
            config.options.remove_comments = false;
        } else if (arg == "--keep-blank-lines") {
            config.options.remove_extra_blank_lines = false;
        } else if (arg == "--eol") {
            if (!needs_value(i)) break;
            auto target = parse_eol_target(args[++i]);
            if (!target) {
                result.error = "unknown line ending '" + args[i] + "' (use lf, crlf or keep)";
            } else {
                config.options.eol_target = *target;
            }
        } else if (arg == "--language" || arg == "-l") {
            if (!needs_value(i)) break;
            config.options.language_override = args[++i];
            if (!find_profile(config.options.language_override)) {
                result.error = "unknown language '" + args[i] + "' (see --list-languages)";
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (!needs_value(i)) break;
            auto jobs = parse_count(args[++i]);
            if (!jobs) {
                result.error = "invalid job count '" + args[i] + "'";
            } else {
                config.jobs = *jobs;
            }
        } else if (arg == "--config") {
            if (!needs_value(i)) break;
            ++i;  // Already loaded
        } else if (arg == "--preview") {
            config.preview = true;
        } else if (arg == "--write") {
            config.write = true;
        } else if (arg == "-y" || arg == "--yes") {
            config.assume_yes = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--list-languages") {
            config.list_languages = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            result.error = "unknown option " + arg;
        } else {
            config.files.push_back(arg);
        }
    }

    if (result.error.empty() && !result.show_help && !config.list_languages
        && config.files.empty()) {
        result.error = "no input files";
    }

    return result;
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Usage: codeclean [options] <file>...\n";
    oss << "  Strip comments, collapse blank lines, normalize line endings and\n";
    oss << "  pretty-print JSON/XML. Files are only modified with --write.\n\n";
    oss << "      --keep-comments      Do not remove comments\n";
    oss << "      --keep-blank-lines   Do not collapse runs of blank lines\n";
    oss << "      --eol <lf|crlf|keep> Line ending to write (default: keep)\n";
    oss << "  -l, --language <id>      Treat every file as this language\n";
    oss << "  -j, --jobs <n>           Worker threads (default: one per core)\n";
    oss << "      --preview            Show a line diff for each changed file\n";
    oss << "      --write              Overwrite changed files after confirmation\n";
    oss << "  -y, --yes                Do not ask for confirmation\n";
    oss << "      --config <file>      Read key=value defaults from file\n";
    oss << "      --list-languages     Show supported languages and extensions\n";
    oss << "  -v, --verbose            Debug logging\n";
    oss << "  -h, --help               Show this help\n";
    oss << "\nExamples:\n";
    oss << "  codeclean src/*.py --preview            # Preview only\n";
    oss << "  codeclean --eol lf --write -y app.js    # Clean and save\n";
    return oss.str();
}

} // namespace codeclean
