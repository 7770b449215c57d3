#include "NetworkUtils.hpp"
#include "TransferErrors.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/format.h>

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToHost(const std::string& host, int port) {
    struct addrinfo hints {};
    hints.ai_family = AF_INET;        // The data listener is IPv4, keep both ends on one family
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        throw ConnectError(fmt::format("DNS resolution failed for {}: {}",
                                       host, gai_strerror(err)));
    }

    // Single attempt per resolved address, no retries
    std::string last_error = "no usable address";
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_fd < 0) {
            last_error = getLastError();
            continue;
        }

        if (connect(sock_fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(res);
            return sock_fd;
        }

        last_error = getLastError();
        close(sock_fd);
    }

    freeaddrinfo(res);
    throw ConnectError(fmt::format("Failed to connect to {}:{} ({})",
                                   host, port, last_error));
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length) {
    size_t total_sent = 0;

    while (total_sent < length) {
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }

        if (sent == 0) {
            errno = ECONNRESET;
            return false;
        }

        total_sent += static_cast<size_t>(sent);
    }

    return true;
}

bool NetworkUtils::sendData(int fd, const std::string& data) {
    return sendData(fd, data.data(), data.size());
}

// ====================================================================================================
// Listening
// ====================================================================================================

int NetworkUtils::listenOn(int port, int backlog) {
    if (port < 0 || port > 65535) {
        throw BindError(fmt::format("Port {} is out of range", port));
    }

    // Create a TCP Socket
    int listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd < 0) {
        throw BindError(fmt::format("Failed to create socket: {}", getLastError()));
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::string reason = getLastError();
        close(listen_fd);
        throw BindError(fmt::format("Failed to set socket options: {}", reason));
    }

    // Prepare the sockaddr_in Structure
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    // Bind the Socket to the Port
    if (bind(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = getLastError();
        close(listen_fd);
        throw BindError(fmt::format("Failed to bind to port {}: {}", port, reason));
    }

    // Start Listening for Incoming Connections
    if (listen(listen_fd, backlog) < 0) {
        std::string reason = getLastError();
        close(listen_fd);
        throw BindError(fmt::format("Failed to listen on port {}: {}", port, reason));
    }

    return listen_fd;
}

int NetworkUtils::acceptConnection(int listen_fd,
                                   std::optional<std::chrono::milliseconds> timeout) {
    if (timeout) {
        struct pollfd pfd {};
        pfd.fd = listen_fd;
        pfd.events = POLLIN;

        // Signals must not push the deadline out
        auto deadline = std::chrono::steady_clock::now() + *timeout;
        int ready;
        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

            ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready >= 0 || errno != EINTR) break;
        }

        if (ready < 0) {
            throw AcceptError(fmt::format("poll() on listener failed: {}", getLastError()));
        }
        if (ready == 0) {
            throw AcceptError(fmt::format("No data connection within {} ms", timeout->count()));
        }
    }

    // Accept the Incoming Connection
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd;
    do {
        client_fd = accept(listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
    } while (client_fd < 0 && errno == EINTR);

    if (client_fd < 0) {
        throw AcceptError(fmt::format("Failed to accept connection: {}", getLastError()));
    }
    return client_fd;
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

bool NetworkUtils::receiveResponse(int fd, size_t min_length, size_t max_length,
                                   std::chrono::milliseconds idle_timeout, std::string& out) {
    char buf[4096];

    // Phase 1: block until the minimum arrives or the peer closes
    while (out.size() < min_length && out.size() < max_length) {
        size_t want = std::min(sizeof(buf), max_length - out.size());
        ssize_t received = recv(fd, buf, want, 0);

        if (received < 0) {
            if (errno == EINTR) continue;
            return false;
        }

        if (received == 0) {
            // Connection closed by peer, caller checks the length
            return true;
        }

        out.append(buf, static_cast<size_t>(received));
    }

    // Phase 2: take whatever keeps arriving, stop once the line goes quiet
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;

    while (out.size() < max_length) {
        int ready = poll(&pfd, 1, static_cast<int>(idle_timeout.count()));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return true;

        size_t want = std::min(sizeof(buf), max_length - out.size());
        ssize_t received = recv(fd, buf, want, 0);
        if (received < 0 && errno == EINTR) continue;
        if (received <= 0) return true;

        out.append(buf, static_cast<size_t>(received));
    }

    return true;
}

// ====================================================================================================
// Socket Information
// ====================================================================================================

int NetworkUtils::localPort(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

std::string NetworkUtils::peerEndpoint(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return fmt::format("{}:{}", ip, ntohs(addr.sin_port));
}

// ====================================================================================================
// Socket Configuration
// ====================================================================================================

bool NetworkUtils::setSocketTimeout(int fd, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    // Set receive timeout
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return false;
    }

    // Set send timeout
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return false;
    }

    return true;
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
