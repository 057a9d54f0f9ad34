#include "codeclean/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace codeclean {

auto StringUtils::to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto StringUtils::trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto StringUtils::is_blank(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\f' || c == '\v';
    });
}

auto StringUtils::starts_with_at(std::string_view text, size_t pos, std::string_view prefix)
    -> bool {
    return pos <= text.size() && text.substr(pos).starts_with(prefix);
}

} // namespace codeclean
