#include <unistd.h>

#include <fmt/format.h>

#include "Connector.hpp"
#include "NetworkUtils.hpp"
#include "TransferErrors.hpp"


Connector::Connector(const std::string& host, int port)
    : server_host{host}, server_port{port} {}


Connector::~Connector() {
    close();
}


void Connector::open() {
    if (isOpen()) {
        throw ConnectError(fmt::format("Control connection to {}:{} is already open",
                                       server_host, server_port));
    }

    // Resolve and Connect (single attempt)
    socket_fd = NetworkUtils::connectToHost(server_host, server_port);
    remote_endpoint = NetworkUtils::peerEndpoint(socket_fd);
}


void Connector::send(const std::string& bytes) {
    if (!isOpen()) {
        throw SendError("Control connection is not open");
    }

    if (!NetworkUtils::sendData(socket_fd, bytes)) {
        throw SendError(fmt::format("Failed to send {} bytes to {}: {}",
                                    bytes.size(), remote_endpoint,
                                    NetworkUtils::getLastError()));
    }
}


void Connector::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}
