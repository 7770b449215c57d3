#include "Logger.hpp"
#include "ReplyHandler.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <sstream>

class ReplyHandlerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = std::filesystem::path(::testing::TempDir()) / "ftclient_reply";
        std::filesystem::create_directories(dir_);
        logger_ = std::make_unique<Logger>("test-reply", (dir_ / "logs").string(), false);
    }

    static std::string frame(const std::string& line)
    {
        std::string f = line;
        f.resize(Protocol::SERVER_MESSAGE_SIZE, '\0');
        return f;
    }

    static std::string readFile(const std::filesystem::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path dir_;
    std::unique_ptr<Logger> logger_;
    std::ostringstream out_;
};

TEST_F(ReplyHandlerTest, SavesReceivedFile)
{
    std::string target = (dir_ / "saved.txt").string();
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-g", "notes.txt", "6000", "-o", target });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle(frame("fil\n") + "line one\nline two\n"), ExitCode::SUCCESS);

    EXPECT_EQ(readFile(target), "line one\nline two\n");
    EXPECT_NE(out_.str().find("Saved"), std::string::npos);
}

TEST_F(ReplyHandlerTest, PrintsDirectoryWithoutPadding)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-l", "6000" });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle(frame("dir\n") + frame("a.txt\n") + frame("~done\n")), ExitCode::SUCCESS);
    EXPECT_EQ(out_.str(), "a.txt\n");
}

TEST_F(ReplyHandlerTest, ListingEndMarkerIsNotAnEntry)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-l", "6000" });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle(frame("dir\n") + frame(".\n") + frame("..\n") + frame("notes.txt\n") + frame("~done\n")),
              ExitCode::SUCCESS);
    EXPECT_EQ(out_.str(), ".\n..\nnotes.txt\n");
    EXPECT_EQ(out_.str().find("~done"), std::string::npos);
}

TEST_F(ReplyHandlerTest, MissingFileIsRefused)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-g", "missing.txt", "6000" });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle(frame("nof\n")), ExitCode::REFUSED);
    EXPECT_EQ(handler.handle(frame("unk\n")), ExitCode::REFUSED);
}

TEST_F(ReplyHandlerTest, UnwritableTargetIsWriteFailure)
{
    std::string target = (dir_ / "no-such-dir" / "x.txt").string();
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-g", "x.txt", "6000", "-o", target });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle(frame("fil\n") + "data"), ExitCode::WRITE_FAILED);
}

TEST_F(ReplyHandlerTest, UnframedPayloadIsPrintedAsIs)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-l", "6000" });

    ReplyHandler handler(options, *logger_, out_);
    EXPECT_EQ(handler.handle("directory listing!"), ExitCode::SUCCESS);
    EXPECT_EQ(out_.str(), "directory listing!\n");
}
