#ifndef CLIENT_OPTIONS_HPP
#define CLIENT_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

#include "Protocol.hpp"
#include "SessionProtocol.hpp"

/**
 * ClientOptions - Parsed command line
 *
 *   ftclient <server> <servPort> (-l | -g <filename>) <dataPort>
 *            [--tagged] [--timeout <seconds>] [--log-dir <dir>] [-o <path>]
 */
struct ClientOptions {
    std::string server;
    int control_port = 0;
    int data_port = 0;
    bool list_directory = false;
    std::string file_name;
    bool tagged = false;
    std::optional<int> timeout_seconds;
    std::string log_dir = "logs";
    std::string output_path;

    /** @throws UsageError describing the first problem found */
    static ClientOptions parse(const std::vector<std::string>& args);

    Protocol::Request toRequest() const;
    SessionConfig toSessionConfig() const;

    // Where a received file is written
    std::string resolveOutputPath() const;

    static std::string usage(const std::string& program);
};

#endif // CLIENT_OPTIONS_HPP
