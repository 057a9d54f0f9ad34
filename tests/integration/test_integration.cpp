#include "codeclean/application/codeclean_app.hpp"
#include "codeclean/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

namespace codeclean {

using ::testing::NiceMock;
using ::testing::Return;

class MockTerminal : public ITerminal {
public:
    MOCK_METHOD(void, display_screen, (const Screen& screen), (override));
    MOCK_METHOD(std::string, read_line, (), (override));
    MOCK_METHOD(bool, is_interactive, (), (override));
};

// Real files in a scratch directory, mocked terminal
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path()
               / (std::string("codeclean_integration_") + test->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto create(const std::string& name, const std::string& bytes) -> std::string {
        auto path = (dir_ / name).string();
        std::ofstream file(path, std::ios::binary);
        file << bytes;
        return path;
    }

    static auto contents(const std::string& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    auto run(const Config& config, bool interactive = false, const std::string& answer = "")
        -> int {
        auto terminal = std::make_unique<NiceMock<MockTerminal>>();
        ON_CALL(*terminal, is_interactive()).WillByDefault(Return(interactive));
        ON_CALL(*terminal, read_line()).WillByDefault(Return(answer));

        CodeCleanApp app(std::move(terminal), std::make_unique<FileSystem>());
        return app.run(config);
    }

    std::filesystem::path dir_;
};

TEST_F(IntegrationTest, CleansMixedProjectInPlace)
{
    auto c_file = create("main.c", "/* License */\r\nint main() { // entry\r\n\r\n\r\n\r\n"
                                   "    return puts(\"// kept\");\r\n}\r\n");
    auto py_file = create("tool.py", "#!/usr/bin/env python3\n# helper\nx = '#1'  # note\n");
    auto json_file = create("data.json", "{\"z\":1,\"a\":[true]}\n");
    auto bad_json = create("broken.json", "{\"a\": }\n");
    auto text_file = create("notes.txt", "keep # this\n\n\n\nend\n");

    Config config{.files = {c_file, py_file, json_file, bad_json, text_file},
                  .jobs = 2,
                  .write = true,
                  .assume_yes = true};

    EXPECT_EQ(run(config), 0);

    EXPECT_EQ(contents(c_file), "int main() {\r\n\r\n    return puts(\"// kept\");\r\n}\r\n");
    EXPECT_EQ(contents(py_file), "#!/usr/bin/env python3\nx = '#1'\n");
    EXPECT_EQ(contents(json_file), "{\n  \"a\": [\n    true\n  ],\n  \"z\": 1\n}\n");
    EXPECT_EQ(contents(bad_json), "{\"a\": }\n");
    EXPECT_EQ(contents(text_file), "keep # this\n\nend\n");
}

TEST_F(IntegrationTest, EolConversion)
{
    auto file = create("mixed.js", "let a = 1;\r\nlet b = 2;\nlet c = 3;\r");

    Config config{.files = {file}, .write = true, .assume_yes = true};
    config.options.eol_target = EolTarget::LF;

    EXPECT_EQ(run(config), 0);
    EXPECT_EQ(contents(file), "let a = 1;\nlet b = 2;\nlet c = 3;\n");
}

TEST_F(IntegrationTest, DryRunLeavesFilesAlone)
{
    auto file = create("a.cpp", "int x; // note\n");

    Config config{.files = {file}, .preview = true};
    EXPECT_EQ(run(config), 0);
    EXPECT_EQ(contents(file), "int x; // note\n");
}

TEST_F(IntegrationTest, ConfirmationAnswerDecides)
{
    auto file = create("a.sh", "echo hi # greet\n");
    Config config{.files = {file}, .write = true};

    EXPECT_EQ(run(config, true, "n"), 0);
    EXPECT_EQ(contents(file), "echo hi # greet\n");

    EXPECT_EQ(run(config, true, "yes"), 0);
    EXPECT_EQ(contents(file), "echo hi\n");
}

TEST_F(IntegrationTest, BinaryFilesAreSkipped)
{
    auto file = create("blob.c", std::string("int\0\x01\x02 // x\n", 12));
    Config config{.files = {file}, .write = true, .assume_yes = true};

    EXPECT_EQ(run(config), 0);
    EXPECT_EQ(contents(file), std::string("int\0\x01\x02 // x\n", 12));
}

TEST_F(IntegrationTest, MissingFileFails)
{
    Config config{.files = {(dir_ / "nope.c").string()}};
    EXPECT_EQ(run(config), 1);
}

} // namespace codeclean
