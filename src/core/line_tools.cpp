#include "codeclean/core/line_tools.hpp"
#include "codeclean/string_utils.hpp"

namespace codeclean {

auto split_line_spans(std::string_view text) -> std::vector<LineSpan> {
    std::vector<LineSpan> lines;
    size_t start = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        char c = text[pos];
        if (c != '\n' && c != '\r') {
            ++pos;
            continue;
        }

        size_t length = (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') ? 2 : 1;
        lines.push_back(LineSpan{.content = text.substr(start, pos - start),
                                 .terminator = text.substr(pos, length)});
        pos += length;
        start = pos;
    }

    if (start < text.size()) {
        lines.push_back(LineSpan{.content = text.substr(start), .terminator = {}});
    }

    return lines;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (const auto& span : split_line_spans(text)) {
        lines.emplace_back(span.content);
    }
    return lines;
}

auto consolidate_blank_lines(std::string_view text) -> std::string {
    auto lines = split_line_spans(text);
    std::string output;
    output.reserve(text.size());

    size_t i = 0;
    while (i < lines.size()) {
        if (!StringUtils::is_blank(lines[i].content)) {
            output.append(lines[i].content);
            output.append(lines[i].terminator);
            ++i;
            continue;
        }

        size_t run_end = i;
        while (run_end < lines.size() && StringUtils::is_blank(lines[run_end].content)) {
            ++run_end;
        }

        // A longer run keeps only the first line's terminator
        if (run_end - i == 1) {
            output.append(lines[i].content);
        }
        output.append(lines[i].terminator);
        i = run_end;
    }

    return output;
}

auto normalize_eol(std::string_view text, Eol target) -> std::string {
    auto eol = eol_sequence(target);
    std::string output;
    output.reserve(text.size() + text.size() / 16);

    for (size_t pos = 0; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '\r') {
            if (pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
            output.append(eol);
        } else if (c == '\n') {
            output.append(eol);
        } else {
            output.push_back(c);
        }
    }

    return output;
}

auto detect_eol(std::string_view text) -> Eol {
    size_t crlf = 0;
    size_t other = 0;

    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (text[pos] == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
            ++crlf;
            ++pos;
        } else if (text[pos] == '\n' || text[pos] == '\r') {
            ++other;
        }
    }

    return crlf > other ? Eol::CRLF : Eol::LF;
}

auto eol_sequence(Eol eol) -> std::string_view {
    switch (eol) {
    case Eol::LF:
        return "\n";
    case Eol::CRLF:
        return "\r\n";
    }
    return "\n";
}

} // namespace codeclean
