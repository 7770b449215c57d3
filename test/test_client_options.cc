#include "ClientOptions.hpp"
#include "TransferErrors.hpp"
#include <filesystem>
#include <gtest/gtest.h>

TEST(ClientOptionsTest, ParsesListRequest)
{
    ClientOptions options = ClientOptions::parse({ "flip1", "5000", "-l", "6000" });

    EXPECT_EQ(options.server, "flip1");
    EXPECT_EQ(options.control_port, 5000);
    EXPECT_EQ(options.data_port, 6000);
    EXPECT_TRUE(options.list_directory);
    EXPECT_FALSE(options.tagged);
    EXPECT_FALSE(options.timeout_seconds.has_value());
    EXPECT_EQ(options.toRequest().kind(), Protocol::RequestKind::LIST_DIRECTORY);
}

TEST(ClientOptionsTest, ParsesGetFileWithOptions)
{
    ClientOptions options = ClientOptions::parse(
        { "--tagged", "localhost", "5000", "-g", "notes.txt", "6000", "--timeout", "30", "--log-dir", "/tmp/l" });

    EXPECT_EQ(options.file_name, "notes.txt");
    EXPECT_TRUE(options.tagged);
    EXPECT_EQ(options.timeout_seconds.value_or(0), 30);
    EXPECT_EQ(options.log_dir, "/tmp/l");

    Protocol::Request request = options.toRequest();
    EXPECT_EQ(request.kind(), Protocol::RequestKind::GET_FILE);
    EXPECT_EQ(request.fileName(), "notes.txt");
}

TEST(ClientOptionsTest, BuildsSessionConfig)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-l", "6000", "--timeout", "2" });
    SessionConfig config = options.toSessionConfig();

    EXPECT_EQ(config.server_host, "host");
    EXPECT_EQ(config.control_port, 5000);
    EXPECT_EQ(config.data_port, 6000);
    EXPECT_EQ(config.wire_format, Protocol::WireFormat::LEGACY);
    ASSERT_TRUE(config.accept_timeout.has_value());
    EXPECT_EQ(*config.accept_timeout, std::chrono::milliseconds(2000));
}

TEST(ClientOptionsTest, WithoutTimeoutAcceptBlocks)
{
    SessionConfig config = ClientOptions::parse({ "host", "5000", "-l", "6000" }).toSessionConfig();
    EXPECT_FALSE(config.accept_timeout.has_value());
}

TEST(ClientOptionsTest, TaggedEncodingIsOptIn)
{
    SessionConfig plain = ClientOptions::parse({ "host", "5000", "-l", "6000" }).toSessionConfig();
    EXPECT_EQ(plain.wire_format, Protocol::WireFormat::LEGACY);
    EXPECT_EQ(Protocol::encodeRequest(Protocol::Request::listDirectory(), plain.wire_format), "-l");

    SessionConfig tagged = ClientOptions::parse({ "host", "5000", "-l", "6000", "--tagged" }).toSessionConfig();
    EXPECT_EQ(tagged.wire_format, Protocol::WireFormat::TAGGED);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "6000", "--legacy" }), UsageError);
}

TEST(ClientOptionsTest, RequiresExactlyOneRequest)
{
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "6000" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "-g", "a.txt", "6000" }), UsageError);
}

TEST(ClientOptionsTest, RejectsBadPorts)
{
    EXPECT_THROW(ClientOptions::parse({ "host", "abc", "-l", "6000" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "70000" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "60x" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "0", "-l", "6000" }), UsageError);
}

TEST(ClientOptionsTest, RejectsMalformedCommandLines)
{
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "6000", "extra" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "6000", "-g" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "6000", "--verbose" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "6000", "--timeout", "0" }), UsageError);
    EXPECT_THROW(ClientOptions::parse({ "host", "5000", "-l", "6000", "-o", "out.txt" }), UsageError);
}

TEST(ClientOptionsTest, OutputPathDefaultsToBaseNameInWorkingDirectory)
{
    ClientOptions options = ClientOptions::parse({ "host", "5000", "-g", "../secret/notes.txt", "6000" });
    std::filesystem::path expected = std::filesystem::current_path() / "notes.txt";
    EXPECT_EQ(options.resolveOutputPath(), expected.string());

    ClientOptions explicit_out = ClientOptions::parse({ "host", "5000", "-g", "a.txt", "6000", "-o", "/tmp/b.txt" });
    EXPECT_EQ(explicit_out.resolveOutputPath(), "/tmp/b.txt");
}

TEST(ClientOptionsTest, UsageMentionsBothForms)
{
    std::string usage = ClientOptions::usage("ftclient");
    EXPECT_NE(usage.find("ftclient <server> <servPort> -l <dataPort>"), std::string::npos);
    EXPECT_NE(usage.find("-g <filename>"), std::string::npos);
}
