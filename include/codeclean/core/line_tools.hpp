#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codeclean {

enum class Eol {
    LF,
    CRLF
};

// A line's content plus the terminator that ended it (empty for a final unterminated line)
struct LineSpan {
    std::string_view content;
    std::string_view terminator;
};

// Splits on CRLF, LF and lone CR. A trailing terminator does not start a new line.
auto split_line_spans(std::string_view text) -> std::vector<LineSpan>;

// Line contents without terminators
auto split_lines(std::string_view text) -> std::vector<std::string>;

// Collapses every run of two or more whitespace-only lines into a single empty line.
// Single whitespace-only lines are left as they are.
auto consolidate_blank_lines(std::string_view text) -> std::string;

// Rewrites CRLF, LF and lone CR terminators to `target`. Idempotent.
auto normalize_eol(std::string_view text, Eol target) -> std::string;

// Most frequent terminator in `text`; LF when there is none or on a tie
auto detect_eol(std::string_view text) -> Eol;

auto eol_sequence(Eol eol) -> std::string_view;

} // namespace codeclean
