#include "codeclean/application/codeclean_app.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace codeclean {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

class MockTerminal : public ITerminal {
public:
    MOCK_METHOD(void, display_screen, (const Screen& screen), (override));
    MOCK_METHOD(std::string, read_line, (), (override));
    MOCK_METHOD(bool, is_interactive, (), (override));
};

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_text, (const std::string& path), (override));
    MOCK_METHOD(bool, write_text_atomic, (const std::string& text, const std::string& path),
                (override));
    MOCK_METHOD(bool, file_exists, (const std::string& path), (override));
    MOCK_METHOD(bool, is_likely_binary, (const std::string& path), (override));
};

class CodeCleanAppTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_terminal_ = std::make_unique<MockTerminal>();
        mock_filesystem_ = std::make_unique<MockFileSystem>();

        // Capture raw pointers before moving to app
        terminal_ptr_ = mock_terminal_.get();
        filesystem_ptr_ = mock_filesystem_.get();

        // Defaults; expectations set later in a test take precedence
        EXPECT_CALL(*filesystem_ptr_, file_exists(_)).WillRepeatedly(Return(true));
        EXPECT_CALL(*filesystem_ptr_, is_likely_binary(_)).WillRepeatedly(Return(false));
    }

    auto make_app() -> CodeCleanApp {
        return CodeCleanApp(std::move(mock_terminal_), std::move(mock_filesystem_));
    }

    auto given_file(const std::string& path, const std::string& text) -> void {
        EXPECT_CALL(*filesystem_ptr_, read_text(path)).WillRepeatedly(Return(text));
    }

    std::unique_ptr<MockTerminal> mock_terminal_;
    std::unique_ptr<MockFileSystem> mock_filesystem_;

    // Raw pointers for setting expectations
    MockTerminal* terminal_ptr_;
    MockFileSystem* filesystem_ptr_;
};

TEST_F(CodeCleanAppTest, DryRunNeverWrites)
{
    given_file("a.c", "int x; // note\n");
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic(_, _)).Times(0);

    Config config{.files = {"a.c"}};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, WriteWithYesSkipsPrompt)
{
    given_file("a.c", "int x; // note\n");
    given_file("b.c", "int y;\n");
    EXPECT_CALL(*terminal_ptr_, read_line()).Times(0);
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic("int x;\n", "a.c")).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic(_, "b.c")).Times(0);

    Config config{.files = {"a.c", "b.c"}, .write = true, .assume_yes = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, WriteAsksForConfirmation)
{
    given_file("a.py", "x = 1  # note\n");
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillRepeatedly(Return(true));
    EXPECT_CALL(*terminal_ptr_, read_line()).WillOnce(Return("y"));
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic("x = 1\n", "a.py")).WillOnce(Return(true));

    Config config{.files = {"a.py"}, .write = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, DeclinedConfirmationWritesNothing)
{
    given_file("a.py", "x = 1  # note\n");
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillRepeatedly(Return(true));
    EXPECT_CALL(*terminal_ptr_, read_line()).WillOnce(Return(""));
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic(_, _)).Times(0);

    Config config{.files = {"a.py"}, .write = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, NonInteractiveWithoutYesRefusesToWrite)
{
    given_file("a.py", "x = 1  # note\n");
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillRepeatedly(Return(false));
    EXPECT_CALL(*terminal_ptr_, read_line()).Times(0);
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic(_, _)).Times(0);

    Config config{.files = {"a.py"}, .write = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, WriteFailureReturnsError)
{
    given_file("a.c", "/* x */\nint x;\n");
    EXPECT_CALL(*filesystem_ptr_, write_text_atomic(_, "a.c")).WillOnce(Return(false));

    Config config{.files = {"a.c"}, .write = true, .assume_yes = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 1);
}

TEST_F(CodeCleanAppTest, SkipsBinaryAndMissingFiles)
{
    EXPECT_CALL(*filesystem_ptr_, file_exists("gone.c")).WillOnce(Return(false));
    EXPECT_CALL(*filesystem_ptr_, is_likely_binary("image.c")).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_, read_text("gone.c")).Times(0);
    EXPECT_CALL(*filesystem_ptr_, read_text("image.c")).Times(0);
    given_file("ok.c", "int x;\n");

    Config config{.files = {"gone.c", "image.c", "ok.c"}};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 1);  // A named file was missing
}

TEST_F(CodeCleanAppTest, BinaryFileAloneIsNotAnError)
{
    EXPECT_CALL(*filesystem_ptr_, is_likely_binary("logo.png")).WillOnce(Return(true));

    Config config{.files = {"logo.png"}};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(CodeCleanAppTest, PreviewShowsChangedFilesOnly)
{
    given_file("a.c", "int x; // note\n");
    given_file("b.c", "int y;\n");
    EXPECT_CALL(*terminal_ptr_, display_screen(_)).Times(1);

    Config config{.files = {"a.c", "b.c"}, .preview = true};
    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST(CodeCleanAppScreenTest, PreviewScreenFollowsChangedRanges)
{
    auto result = process("a.c", "// header\nint x;\nint y; // note\n", Options{});
    auto screen = CodeCleanApp::compose_preview_screen(result);

    std::vector<std::pair<std::string, LineStyle>> lines;
    for (const auto& line : screen.content) {
        lines.emplace_back(line.text, line.style);
    }

    std::vector<std::pair<std::string, LineStyle>> expected{
        {"--- a.c", LineStyle::HEADER},
        {"+++ a.c", LineStyle::HEADER},
        {"// header", LineStyle::REMOVED},
        {"@@ 1 unchanged line(s) from 2 @@", LineStyle::HEADER},
        {"int y; // note", LineStyle::REMOVED},
        {"int y;", LineStyle::ADDED},
    };
    EXPECT_EQ(lines, expected);
    EXPECT_THAT(screen.status_line, HasSubstr("M a.c [c-like]"));
}

TEST(CodeCleanAppScreenTest, SummaryMarkers)
{
    auto changed = process("a.c", "int x; // note\n", Options{});
    EXPECT_EQ(CodeCleanApp::summary_line(changed), "M a.c [c-like] -1 +1 lines");

    auto unchanged = process("notes.txt", "hello\n", Options{});
    EXPECT_EQ(CodeCleanApp::summary_line(unchanged), "= notes.txt [unknown]");

    auto broken = process("bad.json", "{\"a\": }", Options{});
    EXPECT_EQ(CodeCleanApp::summary_line(broken), "! bad.json [json]");

    auto eol_only = process("x.txt", "a\r\nb\r\n", Options{.eol_target = EolTarget::LF});
    EXPECT_EQ(CodeCleanApp::summary_line(eol_only), "M x.txt [unknown] -0 +0 lines (line endings)");

    auto formatted = process("c.json", "{\"a\":1}", Options{});
    EXPECT_EQ(CodeCleanApp::summary_line(formatted), "M c.json [json] -1 +3 lines (reformatted)");
}

} // namespace codeclean
