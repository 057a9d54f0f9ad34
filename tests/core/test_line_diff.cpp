#include "codeclean/core/line_diff.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace codeclean {

namespace {

auto range(DiffKind kind, size_t start, size_t end) -> ChangedRange {
    return ChangedRange{.kind = kind, .start = start, .end = end};
}

} // namespace

TEST(LineDiffTest, IdenticalTextIsOneUnchangedRange)
{
    auto ranges = diff_lines("a\nb\nc\n", "a\nb\nc\n");
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], range(DiffKind::UNCHANGED, 0, 3));
}

TEST(LineDiffTest, LineEndingsAreIgnored)
{
    auto ranges = diff_lines("a\r\nb\r\n", "a\nb\n");
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].kind, DiffKind::UNCHANGED);
}

TEST(LineDiffTest, RemovedLines)
{
    auto ranges = diff_lines("// x\na\nb\n", "a\nb\n");
    std::vector<ChangedRange> expected{range(DiffKind::REMOVED, 0, 1),
                                       range(DiffKind::UNCHANGED, 1, 3)};
    EXPECT_EQ(ranges, expected);
}

TEST(LineDiffTest, ReplacedLine)
{
    auto ranges = diff_lines("a\nold\nc\n", "a\nnew\nc\n");
    std::vector<ChangedRange> expected{range(DiffKind::UNCHANGED, 0, 1),
                                       range(DiffKind::REMOVED, 1, 2),
                                       range(DiffKind::ADDED, 1, 2),
                                       range(DiffKind::UNCHANGED, 2, 3)};
    EXPECT_EQ(ranges, expected);
}

TEST(LineDiffTest, EmptySides)
{
    EXPECT_TRUE(diff_lines("", "").empty());

    std::vector<ChangedRange> added{range(DiffKind::ADDED, 0, 2)};
    EXPECT_EQ(diff_lines("", "a\nb\n"), added);

    std::vector<ChangedRange> removed{range(DiffKind::REMOVED, 0, 2)};
    EXPECT_EQ(diff_lines("a\nb\n", ""), removed);
}

TEST(LineDiffTest, RangesReplayTheEdit)
{
    std::vector<std::string> original{"/* a */", "int x;", "", "", "", "int y; // b", "z"};
    std::vector<std::string> cleaned{"int x;", "", "int y;", "z", "w"};

    auto ranges = diff_lines(original, cleaned);

    // Rebuild the cleaned side from the ranges
    std::vector<std::string> rebuilt;
    size_t unchanged_lines = 0;
    for (const auto& r : ranges) {
        for (size_t i = r.start; i < r.end; ++i) {
            if (r.kind == DiffKind::UNCHANGED) {
                rebuilt.push_back(original[i]);
                ++unchanged_lines;
            } else if (r.kind == DiffKind::ADDED) {
                rebuilt.push_back(cleaned[i]);
            }
        }
    }
    EXPECT_EQ(rebuilt, cleaned);
    EXPECT_EQ(unchanged_lines, 3u);  // "int x;", "", "z"
}

TEST(LineDiffTest, MinifiedJsonExpandedToManyLines)
{
    std::string minified = "[";
    std::string pretty = "[\n";
    for (int i = 0; i < 10000; ++i) {
        minified += std::to_string(i) + (i + 1 < 10000 ? "," : "");
        pretty += "  " + std::to_string(i) + (i + 1 < 10000 ? ",\n" : "\n");
    }
    minified += "]";
    pretty += "]";

    auto ranges = diff_lines(minified, pretty);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], range(DiffKind::REMOVED, 0, 1));
    EXPECT_EQ(ranges[1], range(DiffKind::ADDED, 0, 10002));
}

TEST(LineDiffTest, TooManyEditsBecomeOneReplacedBlock)
{
    std::vector<std::string> original{"head"};
    std::vector<std::string> cleaned{"head"};
    for (int i = 0; i < 600; ++i) {
        original.push_back("a" + std::to_string(i));
        cleaned.push_back("b" + std::to_string(i));
    }
    original.push_back("tail");
    cleaned.push_back("tail");

    auto ranges = diff_lines(original, cleaned);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0], range(DiffKind::UNCHANGED, 0, 1));
    EXPECT_EQ(ranges[1], range(DiffKind::REMOVED, 1, 601));
    EXPECT_EQ(ranges[2], range(DiffKind::ADDED, 1, 601));
    EXPECT_EQ(ranges[3], range(DiffKind::UNCHANGED, 601, 602));
}

TEST(LineDiffTest, LargeInputWithFewEditsStaysExact)
{
    std::vector<std::string> original;
    std::vector<std::string> cleaned;
    for (int i = 0; i < 20000; ++i) {
        original.push_back("line " + std::to_string(i));
        if (i % 1000 != 500) {
            cleaned.push_back(original.back());
        }
    }

    size_t removed = 0;
    size_t unchanged = 0;
    for (const auto& r : diff_lines(original, cleaned)) {
        EXPECT_NE(r.kind, DiffKind::ADDED);
        (r.kind == DiffKind::REMOVED ? removed : unchanged) += r.size();
    }
    EXPECT_EQ(removed, 20u);
    EXPECT_EQ(unchanged, 19980u);
}

} // namespace codeclean
