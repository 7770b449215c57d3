#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "NetworkUtils.hpp"
#include "SessionProtocol.hpp"
#include "TransferErrors.hpp"


const char* toString(SessionState state) {
    switch (state) {
        case SessionState::IDLE:           return "Idle";
        case SessionState::CONNECTED:      return "Connected";
        case SessionState::REQUEST_SENT:   return "RequestSent";
        case SessionState::PORT_DISCLOSED: return "PortDisclosed";
        case SessionState::AWAITING_DATA:  return "AwaitingData";
        case SessionState::DATA_RECEIVED:  return "DataReceived";
        case SessionState::CLOSED:         return "Closed";
    }
    return "Unknown";
}


SessionProtocol::SessionProtocol(SessionConfig config, Protocol::Request request, Logger& logger)
    : config{std::move(config)}, request{std::move(request)}, logger{logger},
      connector{this->config.server_host, this->config.control_port},
      listener{this->config.data_port} {}


// Members close their own sockets if run() never reached teardown
SessionProtocol::~SessionProtocol() = default;


void SessionProtocol::setObserver(TransitionObserver observer) {
    this->observer = std::move(observer);
}


std::string SessionProtocol::run() {
    if (current_state != SessionState::IDLE) {
        throw std::logic_error("A session can only run once");
    }

    try {
        connect();
        sendRequest();
        discloseDataPort();
        awaitData();
        std::string response = receiveResponse();
        teardown();
        return response;
    } catch (const TransferError& e) {
        failure_kind = e.kind();
        logger.logError(fmt::format("{} in state {}: {}", e.kind(), toString(current_state), e.what()));
        teardown();
        throw;
    }
}

// ====================================================================================================
// Transitions
// ====================================================================================================

// Idle -> Connected
void SessionProtocol::connect() {
    connector.open();
    logger.logConnectionOpened(connector.host(), connector.port());
    logger.logCustomMsg(fmt::format("Control connection to {}", connector.remoteEndpoint()));
    transition(SessionState::CONNECTED);
}

// Connected -> RequestSent
void SessionProtocol::sendRequest() {
    std::string bytes = Protocol::encodeRequest(request, config.wire_format);
    connector.send(bytes);
    logger.logRequest(request.describe());
    transition(SessionState::REQUEST_SENT);
}

// RequestSent -> PortDisclosed
void SessionProtocol::discloseDataPort() {
    // The listener must be accepting before the server learns the port
    listener.open();
    logger.logListening(listener.boundPort());

    connector.send(Protocol::encodeDataPort(listener.boundPort()));
    disclosed_port = listener.boundPort();
    transition(SessionState::PORT_DISCLOSED);
}

// PortDisclosed -> AwaitingData -> DataReceived (connection accepted)
void SessionProtocol::awaitData() {
    transition(SessionState::AWAITING_DATA);

    data_connection = listener.accept(config.accept_timeout);
    logger.logCustomMsg(fmt::format("Data connection from {}", data_connection.remoteEndpoint()));

    // The server may connect and then stall; bound the read the same way
    if (config.accept_timeout &&
        !NetworkUtils::setSocketTimeout(data_connection.fd(), *config.accept_timeout)) {
        throw AcceptError(fmt::format("Failed to set data connection timeout: {}",
                                      NetworkUtils::getLastError()));
    }
}

std::string SessionProtocol::receiveResponse() {
    std::string response = data_connection.receiveResponse(Protocol::MIN_RESPONSE_SIZE,
                                                           config.max_response_bytes,
                                                           config.drain_idle);
    logger.logResponse(response);
    transition(SessionState::DATA_RECEIVED);
    return response;
}

// * -> Closed
void SessionProtocol::teardown() {
    if (current_state == SessionState::CLOSED) return;

    // Each close is independent of the others
    if (connector.isOpen()) {
        connector.close();
        logger.logConnectionClosed(connector.host(), connector.port());
    }
    data_connection.close();
    listener.close();

    transition(SessionState::CLOSED);
}

void SessionProtocol::transition(SessionState next) {
    SessionState previous = current_state;
    current_state = next;
    logger.logStateChange(toString(previous), toString(next));
    if (observer) observer(previous, next);
}
