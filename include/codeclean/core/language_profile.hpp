#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codeclean {

struct QuoteRule {
    std::string open;
    std::string close;             // Same as open for ordinary quotes
    bool backslash_escapes = true;
    bool multiline = false;
    bool raw_delimiter = false;    // C++ R"delim( ... )delim": open, delimiter, '(' and back
    bool regex_literal = false;    // Only opens after an operator or keyword, [...] may hold close

    auto operator==(const QuoteRule& other) const -> bool = default;
};

struct BlockComment {
    std::string open;
    std::string close;

    auto operator==(const BlockComment& other) const -> bool = default;
};

// Formats that are re-serialized from a parsed tree instead of being stripped
enum class StructuredFormat {
    NONE,
    JSON,
    XML
};

struct LanguageProfile {
    std::string id;
    std::vector<std::string> extensions;         // Lowercase, with leading dot
    std::vector<std::string> line_comments;
    std::vector<BlockComment> block_comments;
    std::vector<QuoteRule> quotes;
    bool nested_block_comments = false;
    StructuredFormat structure = StructuredFormat::NONE;
    bool markup = false;                         // Quotes only count inside <...>
    std::vector<std::string> raw_text_elements;  // e.g. <script>, copied verbatim
    bool comment_needs_boundary = false;         // Marker must follow whitespace or line start

    // Embedded code regions (PHP). Text starts outside a region, where only
    // template_block_comments are recognised.
    std::vector<std::string> line_comment_terminators; // End a line comment, not consumed
    std::vector<std::string> code_region_openers;      // Case-insensitive
    std::string code_region_close;
    std::vector<BlockComment> template_block_comments;
};

// Static registry, built on first use and never modified afterwards
auto all_profiles() -> const std::vector<LanguageProfile>&;

// Extension lookup (case-insensitive). nullptr means UNKNOWN.
auto classify(std::string_view filename) -> const LanguageProfile*;

// Lookup by profile id for explicit overrides (case-insensitive)
auto find_profile(std::string_view id) -> const LanguageProfile*;

auto file_extension(std::string_view filename) -> std::string;

} // namespace codeclean
