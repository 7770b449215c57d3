#include "Logger.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

static std::vector<std::string> readLines(const std::string& path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = (std::filesystem::path(::testing::TempDir()) / "ftclient_logger" /
                ::testing::UnitTest::GetInstance()->current_test_info()->name()).string();
        std::filesystem::remove_all(dir_);
    }

    std::string dir_;
};

TEST_F(LoggerTest, CreatesDirectoryAndAppends)
{
    Logger logger("s1", dir_, false);
    logger.logConnectionOpened("flip1", 5000);
    logger.logListening(6000);
    logger.logConnectionClosed("flip1", 5000);

    std::vector<std::string> lines = readLines(logger.logFilePath());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("[s1]: Connection opened to flip1:5000"), std::string::npos);
    EXPECT_NE(lines[1].find("Listening on data port 6000"), std::string::npos);
    EXPECT_NE(lines[2].find("Connection closed for flip1:5000"), std::string::npos);
}

TEST_F(LoggerTest, StartsWithTimestamp)
{
    Logger logger("s2", dir_, false);
    logger.logCustomMsg("hello");

    std::vector<std::string> lines = readLines(logger.logFilePath());
    ASSERT_EQ(lines.size(), 1u);
    // YYYY-MM-DD HH:MM:SS
    ASSERT_GE(lines[0].size(), 19u);
    EXPECT_EQ(lines[0][4], '-');
    EXPECT_EQ(lines[0][10], ' ');
    EXPECT_EQ(lines[0][13], ':');
}

TEST_F(LoggerTest, ResponsesAreSanitized)
{
    Logger logger("s3", dir_, false);
    logger.logResponse(std::string("dir\0\0\0", 6));
    logger.logResponse(std::string("ab\0cd\nsecond line", 17));

    std::vector<std::string> lines = readLines(logger.logFilePath());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("Response: dir"), std::string::npos);
    EXPECT_EQ(lines[0].find('\0'), std::string::npos);
    EXPECT_NE(lines[1].find("Response: abcd second line"), std::string::npos);
}

TEST_F(LoggerTest, LongEntriesAreCapped)
{
    Logger logger("s4", dir_, false);
    logger.logRequest(std::string(2000, 'x'));

    std::vector<std::string> lines = readLines(logger.logFilePath());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_LT(lines[0].size(), 600u);
}

TEST_F(LoggerTest, StateChangesAreRecorded)
{
    Logger logger("s5", dir_, false);
    logger.logStateChange("Idle", "Connected");

    std::vector<std::string> lines = readLines(logger.logFilePath());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("State Idle -> Connected"), std::string::npos);
}

TEST_F(LoggerTest, ConsoleEchoShowsFirstEighteenBytes)
{
    Logger logger("s6", dir_, true);

    ::testing::internal::CaptureStdout();
    logger.logResponse("dir\na.txt\nb.txt\nc.txt\nmore entries");
    std::string printed = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(printed, "received response: dir a.txt b.txt c.\n");
}
