#include "codeclean/core/language_profile.hpp"
#include <gtest/gtest.h>
#include <set>

namespace codeclean {

TEST(LanguageProfileTest, ClassifiesByExtension)
{
    ASSERT_NE(classify("main.cpp"), nullptr);
    EXPECT_EQ(classify("main.cpp")->id, "c-like");
    EXPECT_EQ(classify("src/app/script.py")->id, "python");
    EXPECT_EQ(classify("index.HTML")->id, "html");
    EXPECT_EQ(classify("C:\\work\\Build.Java")->id, "java");
    EXPECT_EQ(classify("deploy.yaml")->id, "yaml");
    EXPECT_EQ(classify("package.json")->id, "json");
    EXPECT_EQ(classify("pom.xml")->id, "xml");
}

TEST(LanguageProfileTest, UnknownExtensionIsNotAnError)
{
    EXPECT_EQ(classify("README"), nullptr);
    EXPECT_EQ(classify("archive.tar.zst"), nullptr);
    EXPECT_EQ(classify(".bashrc"), nullptr);
    EXPECT_EQ(classify(""), nullptr);
}

TEST(LanguageProfileTest, FileExtension)
{
    EXPECT_EQ(file_extension("a/b/c.TXT"), ".txt");
    EXPECT_EQ(file_extension("dir.d/file"), "");
    EXPECT_EQ(file_extension(".gitignore"), "");
    EXPECT_EQ(file_extension("archive.tar.gz"), ".gz");
}

TEST(LanguageProfileTest, FindProfileById)
{
    ASSERT_NE(find_profile("Python"), nullptr);
    EXPECT_EQ(find_profile("python")->id, "python");
    EXPECT_EQ(find_profile(" shell "), find_profile("shell"));
    EXPECT_EQ(find_profile("cobol"), nullptr);
}

TEST(LanguageProfileTest, RegistryIsConsistent)
{
    std::set<std::string> ids;
    std::set<std::string> extensions;

    for (const auto& profile : all_profiles()) {
        EXPECT_TRUE(ids.insert(profile.id).second) << "duplicate id " << profile.id;
        EXPECT_FALSE(profile.extensions.empty()) << profile.id;
        for (const auto& extension : profile.extensions) {
            EXPECT_EQ(extension.front(), '.') << extension;
            EXPECT_TRUE(extensions.insert(extension).second) << "duplicate extension " << extension;
        }
        for (const auto& quote : profile.quotes) {
            EXPECT_FALSE(quote.open.empty()) << profile.id;
            EXPECT_FALSE(quote.close.empty()) << profile.id;
        }
    }
}

TEST(LanguageProfileTest, StructuredFormats)
{
    EXPECT_EQ(find_profile("json")->structure, StructuredFormat::JSON);
    EXPECT_EQ(find_profile("xml")->structure, StructuredFormat::XML);
    EXPECT_EQ(find_profile("c-like")->structure, StructuredFormat::NONE);
}

} // namespace codeclean
