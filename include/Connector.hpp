#ifndef CONNECTOR_HPP
#define CONNECTOR_HPP

#include <string>

/**
 * Connector - Owns the control connection to the server
 *
 * One instance per session. open() makes a single connection attempt;
 * the socket is released by close() or by the destructor.
 */
class Connector {
public:
    Connector(const std::string& host, int port);
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    /**
     * Resolve the host and connect to the control port
     * @throws ConnectError on resolution or connect failure
     */
    void open();

    /**
     * Write the whole buffer to the control connection
     * @throws SendError if the connection is closed or the write fails
     */
    void send(const std::string& bytes);

    // Idempotent
    void close();

    bool isOpen() const { return socket_fd != -1; }

    // "address:port" of the connected server, empty until open() succeeds
    const std::string& remoteEndpoint() const { return remote_endpoint; }

    const std::string& host() const { return server_host; }
    int port() const { return server_port; }

private:
    int socket_fd = -1;
    std::string server_host;
    int server_port;
    std::string remote_endpoint;
};

#endif // CONNECTOR_HPP
