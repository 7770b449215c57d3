#ifndef SESSION_PROTOCOL_HPP
#define SESSION_PROTOCOL_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "Connector.hpp"
#include "Listener.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"

enum class SessionState {
    IDLE,
    CONNECTED,
    REQUEST_SENT,
    PORT_DISCLOSED,
    AWAITING_DATA,
    DATA_RECEIVED,
    CLOSED
};

const char* toString(SessionState state);

struct SessionConfig {
    std::string server_host;
    int control_port = 0;
    int data_port = 0;                                             // 0 binds an OS-chosen port
    Protocol::WireFormat wire_format = Protocol::WireFormat::LEGACY;
    std::optional<std::chrono::milliseconds> accept_timeout;       // empty blocks forever
    size_t max_response_bytes = 64 * 1024 * 1024;
    std::chrono::milliseconds drain_idle{500};                     // quiet period that ends the read
};

/**
 * SessionProtocol - Drives one request/response exchange
 *
 * Sequence:
 * 1. Open the control connection
 * 2. Send the encoded request
 * 3. Bind the data listener, then disclose its port on the control connection
 * 4. Accept the server's data connection
 * 5. Read at least MIN_RESPONSE_SIZE bytes, then drain until the server
 *    closes or goes quiet
 * 6. Close everything
 *
 * Every failure closes whatever was opened and is rethrown as the
 * TransferError that caused it. A session runs once; CLOSED is terminal.
 */
class SessionProtocol {
public:
    using TransitionObserver = std::function<void(SessionState from, SessionState to)>;

    SessionProtocol(SessionConfig config, Protocol::Request request, Logger& logger);
    ~SessionProtocol();

    SessionProtocol(const SessionProtocol&) = delete;
    SessionProtocol& operator=(const SessionProtocol&) = delete;

    /**
     * Run the handshake to completion
     * @return The response payload (at least MIN_RESPONSE_SIZE bytes)
     * @throws TransferError subclass naming the failed stage
     * @throws std::logic_error if the session already ran
     */
    std::string run();

    void setObserver(TransitionObserver observer);

    SessionState state() const { return current_state; }

    // Kind of the error that ended the session, empty on success
    const std::string& failureKind() const { return failure_kind; }

    // Port disclosed to the server, -1 before disclosure
    int disclosedPort() const { return disclosed_port; }

    bool controlOpen() const { return connector.isOpen(); }
    bool dataOpen() const { return data_connection.isOpen(); }
    bool listenerOpen() const { return listener.isListening(); }

private:
    SessionConfig config;
    Protocol::Request request;
    Logger& logger;

    Connector connector;
    Listener listener;
    DataConnection data_connection;

    SessionState current_state = SessionState::IDLE;
    TransitionObserver observer;
    std::string failure_kind;
    int disclosed_port = -1;

    void connect();
    void sendRequest();
    void discloseDataPort();
    void awaitData();
    std::string receiveResponse();
    void teardown();

    void transition(SessionState next);
};

#endif // SESSION_PROTOCOL_HPP
