#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include <fmt/format.h>

#include "ClientOptions.hpp"
#include "Logger.hpp"
#include "ReplyHandler.hpp"
#include "SessionProtocol.hpp"
#include "TransferErrors.hpp"


int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Argument Parsing
    ClientOptions options;
    try {
        options = ClientOptions::parse(args);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << ClientOptions::usage(argv[0]);
        return ExitCode::USAGE;
    }

    Logger logger(fmt::format("client-{}", getpid()), options.log_dir);

    std::string payload;
    try {
        SessionProtocol session(options.toSessionConfig(), options.toRequest(), logger);
        payload = session.run();
    } catch (const TransferError&) {
        // Already reported by the session
        return ExitCode::SESSION_FAILED;
    }

    ReplyHandler handler(options, logger, std::cout);
    return handler.handle(payload);
}
