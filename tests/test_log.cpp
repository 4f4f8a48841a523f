// =============================================================================
// Tapshot - Logging Tests
// =============================================================================
#include <gtest/gtest.h>

#include <filesystem>

#include "tapshot_log.hpp"
#include "test_helpers.hpp"

using namespace tapshot;
using tapshot::test::TempDir;

class LogTest : public ::testing::Test {
protected:
    void TearDown() override {
        log::closeLogFile();
        log::setLogLevel(log::Level::Info);
    }
};

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(log::parseLevel("debug"), log::Level::Debug);
    EXPECT_EQ(log::parseLevel("warning"), log::Level::Warn);
    EXPECT_EQ(log::parseLevel("error"), log::Level::Error);
    EXPECT_EQ(log::parseLevel("bogus"), log::Level::Info);
}

TEST_F(LogTest, WritesFilteredLinesToFile) {
    TempDir dir;
    std::string path = dir.file("t.log");
    ASSERT_TRUE(log::openLogFile(path.c_str()));

    log::setLogLevel(log::Level::Warn);
    TLOG_INFO("test", "hidden %d", 1);
    TLOG_WARN("test", "shown %d", 2);
    log::closeLogFile();

    std::string content = tapshot::test::readFile(path);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[WARN ] [test]"), std::string::npos);
    EXPECT_NE(content.find("shown 2"), std::string::npos);
}

TEST_F(LogTest, RotatesBySize) {
    TempDir dir;
    std::string path = dir.file("r.log");
    ASSERT_TRUE(log::openLogFile(path.c_str(), 256, 2));

    for (int i = 0; i < 40; ++i) {
        TLOG_INFO("rotate", "line %d with some padding to fill the file", i);
    }
    log::closeLogFile();

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(path + ".1"));
    EXPECT_TRUE(std::filesystem::exists(path + ".2"));
    EXPECT_FALSE(std::filesystem::exists(path + ".3"));
    EXPECT_LT(std::filesystem::file_size(path), 512u);
}
