#pragma once

#include <stdexcept>
#include <string>

namespace codeclean {

// Malformed JSON/XML. Line and column are 1-based.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& format, size_t line, size_t column, const std::string& detail);

    auto line() const -> size_t { return line_; }
    auto column() const -> size_t { return column_; }
    auto detail() const -> const std::string& { return detail_; }

private:
    size_t line_;
    size_t column_;
    std::string detail_;
};

// 1-based line/column of a byte offset
struct TextLocation {
    size_t line{1};
    size_t column{1};
};

auto locate_offset(const std::string& text, size_t offset) -> TextLocation;

} // namespace codeclean
