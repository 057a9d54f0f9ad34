#include "codeclean/formatters/parse_error.hpp"
#include <algorithm>

namespace codeclean {

ParseError::ParseError(const std::string& format, size_t line, size_t column,
                       const std::string& detail)
    : std::runtime_error(format + " parse error at line " + std::to_string(line) + ", column "
                         + std::to_string(column) + ": " + detail),
      line_(line), column_(column), detail_(detail) {}

auto locate_offset(const std::string& text, size_t offset) -> TextLocation {
    TextLocation location;
    offset = std::min(offset, text.size());

    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n' || (text[i] == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n'))) {
            ++location.line;
            location.column = 1;
        } else if (text[i] != '\r') {
            ++location.column;
        }
    }

    return location;
}

} // namespace codeclean
