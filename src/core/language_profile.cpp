#include "codeclean/core/language_profile.hpp"
#include "codeclean/string_utils.hpp"
#include <algorithm>

namespace codeclean {

namespace {

auto quote(std::string delimiter, bool escapes, bool multiline) -> QuoteRule {
    return QuoteRule{.open = delimiter,
                     .close = delimiter,
                     .backslash_escapes = escapes,
                     .multiline = multiline};
}

auto quote(std::string open, std::string close, bool escapes, bool multiline) -> QuoteRule {
    return QuoteRule{.open = std::move(open),
                     .close = std::move(close),
                     .backslash_escapes = escapes,
                     .multiline = multiline};
}

auto raw_string_quote() -> QuoteRule {
    return QuoteRule{.open = "R\"",
                     .close = "\"",
                     .backslash_escapes = false,
                     .multiline = true,
                     .raw_delimiter = true};
}

auto regex_quote() -> QuoteRule {
    return QuoteRule{.open = "/",
                     .close = "/",
                     .backslash_escapes = true,
                     .multiline = false,
                     .regex_literal = true};
}

const BlockComment C_BLOCK{.open = "/*", .close = "*/"};
const BlockComment MARKUP_BLOCK{.open = "<!--", .close = "-->"};

auto build_profiles() -> std::vector<LanguageProfile> {
    std::vector<LanguageProfile> profiles;

    profiles.push_back(LanguageProfile{
        .id = "c-like",
        .extensions = {".c", ".h", ".cc", ".cpp", ".cxx", ".c++", ".hpp", ".hh", ".hxx", ".ipp",
                       ".inl", ".m", ".mm"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {raw_string_quote(), quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "java",
        .extensions = {".java"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"\"\"", true, true), quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "csharp",
        .extensions = {".cs"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"\"\"", false, true), quote("@\"", "\"", false, true),
                   quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "javascript",
        .extensions = {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx", ".mts", ".cts"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("`", true, true), quote("\"", true, false), quote("'", true, false),
                   regex_quote()}});

    profiles.push_back(LanguageProfile{
        .id = "go",
        .extensions = {".go"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("`", false, true), quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "swift",
        .extensions = {".swift"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"\"\"", true, true), quote("\"", true, false)},
        .nested_block_comments = true});

    profiles.push_back(LanguageProfile{
        .id = "kotlin",
        .extensions = {".kt", ".kts", ".scala", ".sc"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"\"\"", false, true), quote("\"", true, false), quote("'", true, false)},
        .nested_block_comments = true});

    profiles.push_back(LanguageProfile{
        .id = "css",
        .extensions = {".css"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "scss",
        .extensions = {".scss", ".less", ".sass"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"", true, false), quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "python",
        .extensions = {".py", ".pyw", ".pyi"},
        .line_comments = {"#"},
        .quotes = {quote("\"\"\"", true, true), quote("'''", true, true), quote("\"", true, false),
                   quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "php",
        .extensions = {".php", ".phtml"},
        .line_comments = {"//", "#"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"", true, true), quote("'", true, true), quote("`", true, true)},
        .line_comment_terminators = {"?>"},
        .code_region_openers = {"<?php", "<?="},
        .code_region_close = "?>",
        .template_block_comments = {MARKUP_BLOCK}});

    profiles.push_back(LanguageProfile{
        .id = "ruby",
        .extensions = {".rb", ".rake", ".gemspec"},
        .line_comments = {"#"},
        .block_comments = {BlockComment{.open = "=begin", .close = "=end"}},
        .quotes = {quote("\"", true, true), quote("'", true, true)}});

    profiles.push_back(LanguageProfile{
        .id = "perl",
        .extensions = {".pl", ".pm"},
        .line_comments = {"#"},
        .quotes = {quote("\"", true, true), quote("'", true, true)},
        .comment_needs_boundary = true});

    profiles.push_back(LanguageProfile{
        .id = "shell",
        .extensions = {".sh", ".bash", ".zsh", ".ksh"},
        .line_comments = {"#"},
        .quotes = {quote("\"", true, true), quote("'", false, true)},
        .comment_needs_boundary = true});

    profiles.push_back(LanguageProfile{
        .id = "yaml",
        .extensions = {".yml", ".yaml"},
        .line_comments = {"#"},
        .quotes = {quote("\"", true, false), quote("'", false, false)},
        .comment_needs_boundary = true});

    profiles.push_back(LanguageProfile{
        .id = "toml",
        .extensions = {".toml"},
        .line_comments = {"#"},
        .quotes = {quote("\"\"\"", true, true), quote("'''", false, true), quote("\"", true, false),
                   quote("'", false, false)}});

    profiles.push_back(LanguageProfile{
        .id = "ini",
        .extensions = {".ini", ".cfg", ".conf", ".properties"},
        .line_comments = {";", "#"},
        .comment_needs_boundary = true});

    profiles.push_back(LanguageProfile{
        .id = "sql",
        .extensions = {".sql"},
        .line_comments = {"--"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("'", false, true), quote("\"", false, true)}});

    profiles.push_back(LanguageProfile{
        .id = "lua",
        .extensions = {".lua"},
        .line_comments = {"--"},
        .block_comments = {BlockComment{.open = "--[[", .close = "]]"}},
        .quotes = {quote("[[", "]]", false, true), quote("\"", true, false),
                   quote("'", true, false)}});

    profiles.push_back(LanguageProfile{
        .id = "html",
        .extensions = {".html", ".htm", ".xhtml", ".vue"},
        .block_comments = {MARKUP_BLOCK},
        .quotes = {quote("\"", false, true), quote("'", false, true)},
        .markup = true,
        .raw_text_elements = {"script", "style"}});

    profiles.push_back(LanguageProfile{
        .id = "markdown",
        .extensions = {".md", ".markdown"},
        .block_comments = {MARKUP_BLOCK}});

    profiles.push_back(LanguageProfile{
        .id = "xml",
        .extensions = {".xml", ".xsd", ".xsl", ".xslt", ".svg", ".xaml", ".csproj", ".vcxproj",
                       ".plist", ".rss", ".wsdl"},
        .block_comments = {MARKUP_BLOCK},
        .quotes = {quote("\"", false, true), quote("'", false, true)},
        .structure = StructuredFormat::XML,
        .markup = true});

    profiles.push_back(LanguageProfile{
        .id = "json",
        .extensions = {".json", ".jsonc", ".geojson"},
        .line_comments = {"//"},
        .block_comments = {C_BLOCK},
        .quotes = {quote("\"", true, false)},
        .structure = StructuredFormat::JSON});

    return profiles;
}

} // namespace

auto all_profiles() -> const std::vector<LanguageProfile>& {
    static const std::vector<LanguageProfile> profiles = build_profiles();
    return profiles;
}

auto file_extension(std::string_view filename) -> std::string {
    auto slash = filename.find_last_of("/\\");
    auto basename = slash == std::string_view::npos ? filename : filename.substr(slash + 1);

    auto dot = basename.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return "";  // No extension, or a dotfile such as ".bashrc"
    }
    return StringUtils::to_lowercase(basename.substr(dot));
}

auto classify(std::string_view filename) -> const LanguageProfile* {
    auto extension = file_extension(filename);
    if (extension.empty()) {
        return nullptr;
    }

    for (const auto& profile : all_profiles()) {
        if (std::find(profile.extensions.begin(), profile.extensions.end(), extension)
            != profile.extensions.end()) {
            return &profile;
        }
    }
    return nullptr;
}

auto find_profile(std::string_view id) -> const LanguageProfile* {
    auto wanted = StringUtils::to_lowercase(StringUtils::trim(id));
    for (const auto& profile : all_profiles()) {
        if (profile.id == wanted) {
            return &profile;
        }
    }
    return nullptr;
}

} // namespace codeclean
