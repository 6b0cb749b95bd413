#include "ini_reader.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace cfg2;

class IniReaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "herder_ini_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    void writeTestFile(const std::string &filename, const std::string &content)
    {
        std::ofstream file(test_dir / filename);
        file << content;
    }

    std::filesystem::path getTestFilePath(const std::string &filename) { return test_dir / filename; }

    std::filesystem::path test_dir;
};

TEST_F(IniReaderTest, ParsesSectionsAndKeysInFileOrder)
{
    writeTestFile("herder.ini", R"([general]
log_type = console
log_priority = debug

[herder]
unicorn = unicorn
pidfile = /run/app/unicorn.pid
overlap = 30
)");

    ConfigNode root = parseIniFile(getTestFilePath("herder.ini"));

    EXPECT_TRUE(root.isRoot());
    ASSERT_EQ(root.children.size(), 2);
    EXPECT_EQ(root.children[0].key, "general");
    EXPECT_EQ(root.children[1].key, "herder");

    const ConfigNode *herder = root.findChild("herder");
    ASSERT_NE(herder, nullptr);
    EXPECT_TRUE(herder->isSection());
    ASSERT_EQ(herder->children.size(), 3);
    EXPECT_EQ(herder->children[0].key, "unicorn");
    EXPECT_EQ(herder->children[1].key, "pidfile");
    EXPECT_EQ(herder->children[2].key, "overlap");

    const ConfigNode *pidfile = herder->findChild("pidfile");
    ASSERT_NE(pidfile, nullptr);
    EXPECT_TRUE(pidfile->isValue());
    EXPECT_EQ(pidfile->value, "/run/app/unicorn.pid");
}

TEST_F(IniReaderTest, KeepsQuotesAndSpacesInValues)
{
    writeTestFile("args.ini", R"([herder]
args = -c "/etc/gunicorn/conf.py" app:application
)");

    ConfigNode root = parseIniFile(getTestFilePath("args.ini"));

    const ConfigNode *herder = root.findChild("herder");
    ASSERT_NE(herder, nullptr);
    const ConfigNode *args = herder->findChild("args");
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->value, R"(-c "/etc/gunicorn/conf.py" app:application)");
}

TEST_F(IniReaderTest, SkipsComments)
{
    writeTestFile("comments.ini", R"(# herder configuration
[herder]
; pidfile written by gunicorn
pidfile = gunicorn.pid
)");

    ConfigNode root = parseIniFile(getTestFilePath("comments.ini"));

    ASSERT_EQ(root.children.size(), 1);
    EXPECT_EQ(root.children[0].children.size(), 1);
}

TEST_F(IniReaderTest, GlobalKeysBecomeRootValues)
{
    writeTestFile("global.ini", R"(pidfile = stray.pid
[herder]
overlap = 10
)");

    ConfigNode root = parseIniFile(getTestFilePath("global.ini"));

    ASSERT_EQ(root.children.size(), 2);
    EXPECT_TRUE(root.children[0].isValue());
    EXPECT_EQ(root.children[0].key, "pidfile");
    EXPECT_TRUE(root.children[1].isSection());
}

TEST_F(IniReaderTest, ThrowsOnMissingFile)
{
    EXPECT_THROW(parseIniFile("/nonexistent/herder.ini"), std::runtime_error);
}
