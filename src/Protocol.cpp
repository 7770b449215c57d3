#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "Protocol.hpp"
#include "TransferErrors.hpp"

namespace Protocol {

    Request::Request(RequestKind kind, std::string name)
        : request_kind{kind}, file_name{std::move(name)} {}

    Request Request::listDirectory() {
        return Request(RequestKind::LIST_DIRECTORY, "");
    }

    Request Request::getFile(const std::string& file_name) {
        if (file_name.empty()) {
            throw ProtocolError("File name must not be empty");
        }
        return Request(RequestKind::GET_FILE, file_name);
    }

    std::string Request::describe() const {
        if (request_kind == RequestKind::LIST_DIRECTORY) return "LIST_DIRECTORY";
        return fmt::format("GET_FILE {}", file_name);
    }

    std::string encodeRequest(const Request& request, WireFormat format) {
        if (format == WireFormat::TAGGED) {
            std::string bytes(1, static_cast<char>(request.kind()));
            if (request.kind() == RequestKind::GET_FILE) {
                bytes += request.fileName();
            }
            return bytes;
        }

        // Legacy: the server tells the variants apart by content alone
        if (request.kind() == RequestKind::LIST_DIRECTORY) {
            return LIST_COMMAND;
        }
        if (request.fileName() == LIST_COMMAND) {
            throw ProtocolError("A file named \"-l\" cannot be requested with the legacy encoding");
        }
        return request.fileName();
    }

    std::string encodeDataPort(int port) {
        return std::to_string(port);
    }

    const char* toString(ReplyIntent intent) {
        switch (intent) {
            case ReplyIntent::DIRECTORY:       return "directory";
            case ReplyIntent::FILE:            return "file";
            case ReplyIntent::NOT_FOUND:       return "file not found";
            case ReplyIntent::UNKNOWN_COMMAND: return "unknown command";
            case ReplyIntent::UNRECOGNIZED:    return "unrecognized";
        }
        return "unrecognized";
    }

    Reply Reply::parse(const std::string& payload) {
        Reply reply;

        // Status line ends at the first newline inside the leading frame
        size_t frame_end = std::min(payload.size(), SERVER_MESSAGE_SIZE);
        size_t newline = payload.find('\n');
        if (newline == std::string::npos || newline >= frame_end) {
            reply.body = payload;
            return reply;
        }

        std::string status = payload.substr(0, newline);
        if (status == "dir")      reply.intent = ReplyIntent::DIRECTORY;
        else if (status == "fil") reply.intent = ReplyIntent::FILE;
        else if (status == "nof") reply.intent = ReplyIntent::NOT_FOUND;
        else if (status == "unk") reply.intent = ReplyIntent::UNKNOWN_COMMAND;
        else {
            reply.body = payload;
            return reply;
        }

        // A full frame is NUL-padded; anything shorter ends at the newline
        bool padded = payload.size() >= SERVER_MESSAGE_SIZE &&
                      std::all_of(payload.begin() + newline + 1,
                                  payload.begin() + SERVER_MESSAGE_SIZE,
                                  [](char c) { return c == '\0'; });
        size_t body_start = padded ? SERVER_MESSAGE_SIZE : newline + 1;
        reply.body = payload.substr(body_start);
        return reply;
    }

    std::string stripPadding(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        std::copy_if(text.begin(), text.end(), std::back_inserter(out),
                     [](char c) { return c != '\0'; });
        return out;
    }

} // namespace Protocol
