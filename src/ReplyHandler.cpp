#include <fstream>
#include <string>

#include <fmt/format.h>

#include "Protocol.hpp"
#include "ReplyHandler.hpp"


ReplyHandler::ReplyHandler(const ClientOptions& options, Logger& logger, std::ostream& out)
    : options{options}, logger{logger}, out{out} {}


int ReplyHandler::handle(const std::string& payload) {
    Protocol::Reply reply = Protocol::Reply::parse(payload);
    logger.logCustomMsg(fmt::format("Reply intent: {}", Protocol::toString(reply.intent)));

    switch (reply.intent) {
        case Protocol::ReplyIntent::DIRECTORY: {
            std::string listing = Protocol::stripPadding(reply.body);
            if (listing.ends_with(Protocol::LISTING_END)) {
                listing.erase(listing.size() - std::char_traits<char>::length(Protocol::LISTING_END));
            }
            out << listing;
            return ExitCode::SUCCESS;
        }

        case Protocol::ReplyIntent::FILE: {
            if (options.list_directory) {
                // Nowhere sensible to save it, show it instead
                out << reply.body;
                return ExitCode::SUCCESS;
            }

            std::string path = options.resolveOutputPath();
            if (!writeFile(path, reply.body)) {
                logger.logError(fmt::format("Failed to save file to {}", path));
                return ExitCode::WRITE_FAILED;
            }
            out << fmt::format("Saved {} ({} bytes)\n", path, reply.body.size());
            logger.logCustomMsg(fmt::format("Saved {} bytes to {}", reply.body.size(), path));
            return ExitCode::SUCCESS;
        }

        case Protocol::ReplyIntent::NOT_FOUND:
            logger.logError(fmt::format("Server does not have file: {}", options.file_name));
            return ExitCode::REFUSED;

        case Protocol::ReplyIntent::UNKNOWN_COMMAND:
            logger.logError("Server did not understand the request");
            return ExitCode::REFUSED;

        case Protocol::ReplyIntent::UNRECOGNIZED:
            break;
    }

    out << payload;
    if (!payload.empty() && payload.back() != '\n') out << '\n';
    return ExitCode::SUCCESS;
}


bool ReplyHandler::writeFile(const std::string& file_path, const std::string& data) {
    // Create File Stream, Open File
    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file) return false;

    // Write File Contents
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return file.good();
}
