#pragma once

#include <string>
#include <string_view>

namespace codeclean {

class StringUtils {
public:
    static auto to_lowercase(std::string_view text) -> std::string;

    // Strips spaces, tabs, CR and LF from both ends
    static auto trim(std::string_view text) -> std::string;

    static auto is_blank(std::string_view text) -> bool;

    static auto starts_with_at(std::string_view text, size_t pos, std::string_view prefix) -> bool;
};

} // namespace codeclean
