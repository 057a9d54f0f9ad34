#include "codeclean/formatters/json_formatter.hpp"
#include "codeclean/formatters/parse_error.hpp"
#include <nlohmann/json.hpp>

namespace codeclean {

namespace {

constexpr int JSON_INDENT = 2;

// nlohmann messages repeat the position we already report
auto exception_detail(const std::string& what) -> std::string {
    auto column = what.find("column");
    if (column == std::string::npos) {
        // "[json.exception.out_of_range.406] number overflow ..."
        auto id_end = what.find("] ");
        return id_end == std::string::npos ? what : what.substr(id_end + 2);
    }
    auto separator = what.find(": ", column);
    if (separator == std::string::npos) {
        return what;
    }
    return what.substr(separator + 2);
}

auto ends_with_newline(const std::string& text) -> bool {
    return !text.empty() && (text.back() == '\n' || text.back() == '\r');
}

} // namespace

auto format_json(const std::string& text) -> std::string {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/true,
                                         /*ignore_comments=*/true);
    } catch (const nlohmann::json::parse_error& e) {
        auto location = locate_offset(text, e.byte > 0 ? e.byte - 1 : 0);
        throw ParseError("JSON", location.line, location.column, exception_detail(e.what()));
    } catch (const nlohmann::json::exception& e) {
        // Out-of-range numbers carry no position
        throw ParseError("JSON", 1, 1, exception_detail(e.what()));
    }

    std::string output;
    try {
        output = document.dump(JSON_INDENT);
    } catch (const nlohmann::json::exception& e) {
        // Strings that are not valid UTF-8
        throw ParseError("JSON", 1, 1, exception_detail(e.what()));
    }

    if (ends_with_newline(text)) {
        output.push_back('\n');
    }
    return output;
}

} // namespace codeclean
