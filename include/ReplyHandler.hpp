#ifndef REPLY_HANDLER_HPP
#define REPLY_HANDLER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "ClientOptions.hpp"
#include "Logger.hpp"

// Process exit codes
namespace ExitCode {
    constexpr int SUCCESS        = 0;
    constexpr int USAGE          = 1;
    constexpr int SESSION_FAILED = 2;
    constexpr int REFUSED        = 3;
    constexpr int WRITE_FAILED   = 4;
}

/**
 * ReplyHandler - Acts on a response once the session has closed
 *
 * Directory listings are printed, files are written to disk, refusals
 * from the server are reported. Payloads that carry no recognizable
 * status frame are printed as they arrived.
 */
class ReplyHandler {
public:
    ReplyHandler(const ClientOptions& options, Logger& logger, std::ostream& out);

    /** @return One of the ExitCode values */
    int handle(const std::string& payload);

private:
    const ClientOptions& options;
    Logger& logger;
    std::ostream& out;

    bool writeFile(const std::string& path, const std::string& data);
};

#endif // REPLY_HANDLER_HPP
