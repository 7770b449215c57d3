#include <unistd.h>
#include <utility>

#include <fmt/format.h>

#include "Listener.hpp"
#include "NetworkUtils.hpp"
#include "TransferErrors.hpp"

// ====================================================================================================
// DataConnection
// ====================================================================================================

DataConnection::DataConnection(int fd)
    : socket_fd{fd}, remote_endpoint{NetworkUtils::peerEndpoint(fd)} {}

DataConnection::~DataConnection() {
    close();
}

DataConnection::DataConnection(DataConnection&& other) noexcept
    : socket_fd{std::exchange(other.socket_fd, -1)},
      remote_endpoint{std::move(other.remote_endpoint)} {}

DataConnection& DataConnection::operator=(DataConnection&& other) noexcept {
    if (this != &other) {
        close();
        socket_fd = std::exchange(other.socket_fd, -1);
        remote_endpoint = std::move(other.remote_endpoint);
    }
    return *this;
}

std::string DataConnection::receiveResponse(size_t min_size, size_t max_size,
                                            std::chrono::milliseconds idle_timeout) {
    if (!isOpen()) {
        throw ProtocolError("Data connection is not open");
    }

    std::string payload;
    if (!NetworkUtils::receiveResponse(socket_fd, min_size, max_size, idle_timeout, payload)) {
        throw ProtocolError(fmt::format("Receive failed on data connection after {} bytes: {}",
                                        payload.size(), NetworkUtils::getLastError()));
    }

    if (payload.size() < min_size) {
        throw ProtocolError(fmt::format("Short response: expected at least {} bytes, received {}",
                                        min_size, payload.size()));
    }
    return payload;
}

void DataConnection::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}

// ====================================================================================================
// Listener
// ====================================================================================================

Listener::Listener(int port)
    : requested_port{port} {}

Listener::~Listener() {
    close();
}

void Listener::open() {
    if (isListening()) {
        throw BindError(fmt::format("Listener on port {} is already open", bound_port));
    }

    socket_fd = NetworkUtils::listenOn(requested_port, BACKLOG);

    // Resolve the Real Port (matters when port 0 was requested)
    bound_port = NetworkUtils::localPort(socket_fd);
    if (bound_port < 0) {
        std::string reason = NetworkUtils::getLastError();
        close();
        throw BindError(fmt::format("Failed to read bound port: {}", reason));
    }
}

DataConnection Listener::accept(std::optional<std::chrono::milliseconds> timeout) {
    if (!isListening()) {
        throw AcceptError("Listener is not open");
    }
    return DataConnection(NetworkUtils::acceptConnection(socket_fd, timeout));
}

void Listener::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}
