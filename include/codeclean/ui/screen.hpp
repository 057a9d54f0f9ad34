#pragma once

#include <string>
#include <vector>

namespace codeclean {

enum class LineStyle {
    PLAIN,
    HEADER,
    REMOVED,
    ADDED
};

struct Line {
    std::string text;
    LineStyle style = LineStyle::PLAIN;
};

struct Screen {
    std::vector<Line> content;
    std::string status_line;
};

} // namespace codeclean
