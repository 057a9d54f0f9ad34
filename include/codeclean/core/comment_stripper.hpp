#pragma once

#include "codeclean/core/language_profile.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace codeclean {

enum class ScanMode {
    CODE,
    LINE_COMMENT,
    BLOCK_COMMENT,
    STRING
};

// Transient state of one strip() call
struct ScanState {
    size_t pos{};
    size_t line{1};                              // 1-based input line at pos
    ScanMode mode = ScanMode::CODE;
    const QuoteRule* active_quote = nullptr;
    std::string active_close;                    // Closing delimiter of the open string
    const BlockComment* active_block = nullptr;
    size_t block_depth{};
    size_t mode_start_line{};                    // Where the open string/comment began
    bool comment_owns_line = false;              // Only whitespace preceded the comment
    bool in_regex_class = false;                 // Inside [...] of a regex literal
    bool in_template_text = false;               // Outside <?php ... ?>

    std::string output;
    size_t output_line_start{};

    // Markup bookkeeping
    bool in_tag = false;
    std::string pending_raw_element;             // Opening tag seen, waiting for '>'
    std::string raw_text_end;                    // e.g. "</script" while inside <script>
};

struct StripResult {
    std::string text;
    std::vector<std::string> warnings;           // Unterminated comments and strings
};

// Removes the comments described by `profile` in a single left-to-right pass.
// String and character literals are copied byte for byte, whatever they contain.
// A line that held nothing but comments disappears together with its terminator;
// a comment after code keeps the line terminator.
auto strip_comments(std::string_view text, const LanguageProfile& profile) -> StripResult;

} // namespace codeclean
