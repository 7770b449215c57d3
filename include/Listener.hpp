#ifndef LISTENER_HPP
#define LISTENER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/**
 * DataConnection - The single connection the server dials back on
 *
 * Carries exactly one response and is then closed. Movable, not copyable.
 */
class DataConnection {
public:
    DataConnection() = default;
    explicit DataConnection(int fd);
    ~DataConnection();

    DataConnection(DataConnection&& other) noexcept;
    DataConnection& operator=(DataConnection&& other) noexcept;
    DataConnection(const DataConnection&) = delete;
    DataConnection& operator=(const DataConnection&) = delete;

    /**
     * Read the response
     *
     * Waits for min_size bytes, then keeps reading until the server closes,
     * goes idle for idle_timeout, or max_size is reached.
     *
     * @param min_size Fewest bytes that make a valid response
     * @param max_size Reading stops once this many bytes have arrived
     * @param idle_timeout Quiet period that ends the read after min_size
     * @throws ProtocolError on a short read or a receive failure
     */
    std::string receiveResponse(size_t min_size, size_t max_size,
                                std::chrono::milliseconds idle_timeout);

    // Idempotent
    void close();

    bool isOpen() const { return socket_fd != -1; }
    const std::string& remoteEndpoint() const { return remote_endpoint; }
    int fd() const { return socket_fd; }

private:
    int socket_fd = -1;
    std::string remote_endpoint;
};

/**
 * Listener - Listening endpoint for the data connection
 *
 * Binds all local interfaces with a backlog of one; the protocol never
 * expects more than one inbound connection per session.
 */
class Listener {
public:
    static constexpr int BACKLOG = 1;

    explicit Listener(int port);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /**
     * Bind and start listening
     * @throws BindError if the port is in use or out of range
     */
    void open();

    /**
     * Block until the server connects
     *
     * @param timeout Optional deadline, blocks forever when empty
     * @throws AcceptError on failure or timeout
     */
    DataConnection accept(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Idempotent
    void close();

    bool isListening() const { return socket_fd != -1; }

    // Port requested at construction (0 means OS-chosen)
    int requestedPort() const { return requested_port; }

    // Port actually bound, -1 before open()
    int boundPort() const { return bound_port; }

private:
    int socket_fd = -1;
    int requested_port;
    int bound_port = -1;
};

#endif // LISTENER_HPP
