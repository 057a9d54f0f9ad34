#include "codeclean/core/line_diff.hpp"
#include "codeclean/core/line_tools.hpp"
#include <algorithm>
#include <cstddef>
#include <optional>

namespace codeclean {

namespace {

// Appends one line operation, extending the previous range when the kind matches
auto push_op(std::vector<ChangedRange>& ranges, DiffKind kind, size_t index) -> void {
    if (!ranges.empty() && ranges.back().kind == kind && ranges.back().end == index) {
        ++ranges.back().end;
        return;
    }
    ranges.push_back(ChangedRange{.kind = kind, .start = index, .end = index + 1});
}

struct Op {
    DiffKind kind;
    size_t original_index;
    size_t cleaned_index;
};

// Beyond this many inserted plus deleted lines the snapshots below would cost
// O(D^2) memory, so the middle is reported as one replaced block instead
constexpr std::ptrdiff_t MAX_EDIT_DISTANCE = 1000;

// Myers' greedy O(ND) algorithm over a[lo_a, hi_a) and b[lo_b, hi_b).
// Each round keeps a snapshot of the frontier limited to diagonals [-d-1, d+1].
// Returns nullopt when the edit distance exceeds MAX_EDIT_DISTANCE.
auto myers(const std::vector<std::string>& a, size_t lo_a, size_t hi_a,
           const std::vector<std::string>& b, size_t lo_b, size_t hi_b)
    -> std::optional<std::vector<Op>> {
    const auto n = static_cast<std::ptrdiff_t>(hi_a - lo_a);
    const auto m = static_cast<std::ptrdiff_t>(hi_b - lo_b);
    const std::ptrdiff_t max_d = std::min(n + m, MAX_EDIT_DISTANCE);
    const std::ptrdiff_t offset = max_d + 1;

    std::vector<std::ptrdiff_t> v(static_cast<size_t>(2 * max_d + 3), 0);
    std::vector<std::vector<std::ptrdiff_t>> trace;

    auto equal = [&](std::ptrdiff_t x, std::ptrdiff_t y) {
        return a[lo_a + static_cast<size_t>(x)] == b[lo_b + static_cast<size_t>(y)];
    };

    bool done = false;
    for (std::ptrdiff_t d = 0; d <= max_d && !done; ++d) {
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));

        for (std::ptrdiff_t k = -d; k <= d; k += 2) {
            std::ptrdiff_t x = 0;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
                x = v[offset + k + 1];
            } else {
                x = v[offset + k - 1] + 1;
            }
            std::ptrdiff_t y = x - k;
            while (x < n && y < m && equal(x, y)) {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                done = true;
                break;
            }
        }
    }
    if (!done) {
        return std::nullopt;
    }

    std::vector<Op> ops;
    std::ptrdiff_t x = n;
    std::ptrdiff_t y = m;

    for (auto d = static_cast<std::ptrdiff_t>(trace.size()) - 1; d >= 0; --d) {
        const auto& snap = trace[static_cast<size_t>(d)];
        auto at = [&](std::ptrdiff_t k) { return snap[static_cast<size_t>(k + d + 1)]; };

        std::ptrdiff_t k = x - y;
        std::ptrdiff_t prev_x = 0;
        std::ptrdiff_t prev_y = 0;
        if (d > 0) {
            std::ptrdiff_t prev_k = (k == -d || (k != d && at(k - 1) < at(k + 1))) ? k + 1 : k - 1;
            prev_x = at(prev_k);
            prev_y = prev_x - prev_k;
        }

        while (x > prev_x && y > prev_y) {
            --x;
            --y;
            ops.push_back(Op{DiffKind::UNCHANGED, lo_a + static_cast<size_t>(x),
                             lo_b + static_cast<size_t>(y)});
        }

        if (d > 0) {
            if (x == prev_x) {
                ops.push_back(Op{DiffKind::ADDED, lo_a + static_cast<size_t>(x),
                                 lo_b + static_cast<size_t>(prev_y)});
            } else {
                ops.push_back(Op{DiffKind::REMOVED, lo_a + static_cast<size_t>(prev_x),
                                 lo_b + static_cast<size_t>(y)});
            }
        }
        x = prev_x;
        y = prev_y;
    }

    std::reverse(ops.begin(), ops.end());
    return ops;
}

} // namespace

auto diff_lines(const std::vector<std::string>& original, const std::vector<std::string>& cleaned)
    -> std::vector<ChangedRange> {
    size_t prefix = 0;
    while (prefix < original.size() && prefix < cleaned.size()
           && original[prefix] == cleaned[prefix]) {
        ++prefix;
    }

    size_t suffix = 0;
    while (suffix < original.size() - prefix && suffix < cleaned.size() - prefix
           && original[original.size() - 1 - suffix] == cleaned[cleaned.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<ChangedRange> ranges;
    for (size_t i = 0; i < prefix; ++i) {
        push_op(ranges, DiffKind::UNCHANGED, i);
    }

    auto ops = myers(original, prefix, original.size() - suffix, cleaned, prefix,
                     cleaned.size() - suffix);
    if (ops) {
        for (const auto& op : *ops) {
            push_op(ranges, op.kind,
                    op.kind == DiffKind::ADDED ? op.cleaned_index : op.original_index);
        }
    } else {
        for (size_t i = prefix; i < original.size() - suffix; ++i) {
            push_op(ranges, DiffKind::REMOVED, i);
        }
        for (size_t i = prefix; i < cleaned.size() - suffix; ++i) {
            push_op(ranges, DiffKind::ADDED, i);
        }
    }

    for (size_t i = original.size() - suffix; i < original.size(); ++i) {
        push_op(ranges, DiffKind::UNCHANGED, i);
    }

    return ranges;
}

auto diff_lines(std::string_view original, std::string_view cleaned) -> std::vector<ChangedRange> {
    return diff_lines(split_lines(original), split_lines(cleaned));
}

} // namespace codeclean
