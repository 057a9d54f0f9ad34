#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codeclean {

enum class DiffKind {
    UNCHANGED,
    REMOVED,
    ADDED
};

// Half-open range of line indices. REMOVED and UNCHANGED ranges index the original
// text, ADDED ranges index the cleaned text. Walking the ranges in order replays the
// edit script, so a renderer can place both panes without diffing again.
struct ChangedRange {
    DiffKind kind = DiffKind::UNCHANGED;
    size_t start{};
    size_t end{};

    auto size() const -> size_t { return end - start; }
    auto operator==(const ChangedRange& other) const -> bool = default;
};

// Line-level shortest edit script (Myers). Terminators are ignored, so a pure
// line-ending conversion produces a single UNCHANGED range.
auto diff_lines(std::string_view original, std::string_view cleaned) -> std::vector<ChangedRange>;

auto diff_lines(const std::vector<std::string>& original, const std::vector<std::string>& cleaned)
    -> std::vector<ChangedRange>;

} // namespace codeclean
