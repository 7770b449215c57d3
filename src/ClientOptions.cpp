#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <fmt/format.h>

#include "ClientOptions.hpp"
#include "TransferErrors.hpp"

// Parse a whole-string integer within [low, high]
static int parseInt(const std::string& text, const std::string& what, int low, int high) {
    size_t consumed = 0;
    int value;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::invalid_argument&) {
        throw UsageError(fmt::format("Invalid {}: {}", what, text));
    } catch (const std::out_of_range&) {
        throw UsageError(fmt::format("Invalid {}: {}", what, text));
    }

    if (consumed != text.size() || value < low || value > high) {
        throw UsageError(fmt::format("Invalid {}: {} (expected {}-{})", what, text, low, high));
    }
    return value;
}


ClientOptions ClientOptions::parse(const std::vector<std::string>& args) {
    ClientOptions options;
    std::vector<std::string> positionals;
    bool get_seen = false;

    auto valueFor = [&](size_t& i, const std::string& flag) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw UsageError(fmt::format("Missing value for {}", flag));
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-l") {
            options.list_directory = true;
        } else if (arg == "-g") {
            options.file_name = valueFor(i, arg);
            get_seen = true;
        } else if (arg == "--tagged") {
            options.tagged = true;
        } else if (arg == "--timeout") {
            options.timeout_seconds = parseInt(valueFor(i, arg), "timeout", 1, 86400);
        } else if (arg == "--log-dir") {
            options.log_dir = valueFor(i, arg);
        } else if (arg == "-o") {
            options.output_path = valueFor(i, arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError(fmt::format("Unknown option: {}", arg));
        } else {
            positionals.push_back(arg);
        }
    }

    if (positionals.size() != 3) {
        throw UsageError(fmt::format("Expected <server> <servPort> <dataPort>, got {} positional arguments",
                                     positionals.size()));
    }

    options.server = positionals[0];
    options.control_port = parseInt(positionals[1], "server port", 1, 65535);
    options.data_port = parseInt(positionals[2], "data port", 1, 65535);

    // Exactly one request variant
    if (options.list_directory && get_seen) {
        throw UsageError("-l and -g cannot be combined");
    }
    if (!options.list_directory && !get_seen) {
        throw UsageError("One of -l or -g <filename> is required");
    }
    if (get_seen && options.file_name.empty()) {
        throw UsageError("File name for -g must not be empty");
    }
    if (options.list_directory && !options.output_path.empty()) {
        throw UsageError("-o only applies to -g");
    }

    return options;
}


Protocol::Request ClientOptions::toRequest() const {
    if (list_directory) return Protocol::Request::listDirectory();
    return Protocol::Request::getFile(file_name);
}


SessionConfig ClientOptions::toSessionConfig() const {
    SessionConfig config;
    config.server_host = server;
    config.control_port = control_port;
    config.data_port = data_port;
    config.wire_format = tagged ? Protocol::WireFormat::TAGGED : Protocol::WireFormat::LEGACY;
    if (timeout_seconds) {
        config.accept_timeout = std::chrono::seconds(*timeout_seconds);
    }
    return config;
}


std::string ClientOptions::resolveOutputPath() const {
    if (!output_path.empty()) return output_path;

    // Never write outside the working directory by default
    std::filesystem::path name = std::filesystem::path(file_name).filename();
    return (std::filesystem::current_path() / name).string();
}


std::string ClientOptions::usage(const std::string& program) {
    return fmt::format(
        "Usage:\n"
        "  {0} <server> <servPort> -l <dataPort> [options]\n"
        "  {0} <server> <servPort> -g <filename> <dataPort> [options]\n"
        "Options:\n"
        "  --tagged            Prefix requests with a type byte (needs a server that reads it)\n"
        "  --timeout <sec>     Give up if the server does not dial back in time\n"
        "  --log-dir <dir>     Directory for log.txt (default: logs)\n"
        "  -o <path>           Where to save a received file (default: ./<filename>)\n",
        program);
}
