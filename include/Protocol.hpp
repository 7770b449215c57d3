#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <string>


namespace Protocol {

    // Fewest bytes the server ever sends on the data connection
    constexpr size_t MIN_RESPONSE_SIZE = 18;

    // The server pads each status message to this size
    constexpr size_t SERVER_MESSAGE_SIZE = 500;

    // Last frame of a directory listing
    constexpr const char* LISTING_END = "~done\n";

    // Legacy token for a directory listing request
    constexpr const char* LIST_COMMAND = "-l";

    enum class RequestKind : uint8_t {
        LIST_DIRECTORY = 0x01,
        GET_FILE       = 0x02
    };

    enum class WireFormat {
        TAGGED,  // One discriminant byte, then the optional payload
        LEGACY   // "-l" or the bare file name
    };

    class Request {
    public:
        static Request listDirectory();

        /** @throws ProtocolError if the name is empty */
        static Request getFile(const std::string& file_name);

        RequestKind kind() const { return request_kind; }
        const std::string& fileName() const { return file_name; }

        /** Human readable form for logs */
        std::string describe() const;

    private:
        Request(RequestKind kind, std::string name);

        RequestKind request_kind;
        std::string file_name;
    };

    /**
     * Serialize a request for the control connection
     * @throws ProtocolError if the request cannot be represented in the format
     */
    std::string encodeRequest(const Request& request, WireFormat format);

    // Decimal ASCII, no padding or terminator
    std::string encodeDataPort(int port);

    enum class ReplyIntent {
        DIRECTORY,        // "dir"
        FILE,             // "fil"
        NOT_FOUND,        // "nof"
        UNKNOWN_COMMAND,  // "unk"
        UNRECOGNIZED
    };

    const char* toString(ReplyIntent intent);

    /**
     * Reply - Caller-side reading of a response payload
     *
     * The server opens every reply with a status frame holding one line
     * ("dir", "fil", "nof" or "unk"), NUL-padded to SERVER_MESSAGE_SIZE.
     */
    struct Reply {
        ReplyIntent intent = ReplyIntent::UNRECOGNIZED;
        std::string body;

        static Reply parse(const std::string& payload);
    };

    // Drop NUL padding left by fixed-size server frames
    std::string stripPadding(const std::string& text);

} // namespace Protocol

#endif // PROTOCOL_HPP
