#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Common networking utility functions
 * 
 * Provides the socket operations used by the Connector and the Listener:
 * - Making outbound TCP connections
 * - Sending data with error checking
 * - Binding and listening on a local port
 * - Accepting with an optional deadline
 * - Receiving a payload until the peer closes
 * 
 * This is a utility class with static methods only. Failures are thrown
 * as the matching TransferError subclass.
 */
class NetworkUtils {
public:
    /**
     * Connect to a remote host
     * 
     * Performs DNS resolution (IPv4) and tries each resolved address once.
     * 
     * @param host Hostname or IP address
     * @param port Port number
     * @return Connected socket file descriptor
     * @throws ConnectError if resolution fails or no address accepts
     */
    static int connectToHost(const std::string& host, int port);

    /**
     * Send complete data to socket
     * 
     * Handles partial sends; either every byte is written or the call fails.
     * 
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure (errno is preserved)
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Send string data to socket
     * 
     * Convenience wrapper for sending std::string data.
     */
    static bool sendData(int fd, const std::string& data);

    /**
     * Bind to a local port on all interfaces and start listening
     * 
     * @param port Local port, 0 lets the OS choose
     * @param backlog Listen backlog
     * @return Listening socket file descriptor
     * @throws BindError if the port is out of range or unavailable
     */
    static int listenOn(int port, int backlog);

    /**
     * Accept one inbound connection
     * 
     * Waits with poll() when a timeout is given, otherwise blocks in accept().
     * 
     * @param listen_fd Listening socket
     * @param timeout Optional deadline
     * @return Connected socket file descriptor
     * @throws AcceptError on failure or when the deadline passes
     */
    static int acceptConnection(int listen_fd,
                                std::optional<std::chrono::milliseconds> timeout);

    /**
     * Receive a response of at least min_length bytes
     * 
     * Blocks until min_length bytes arrive or the peer closes. After that,
     * reading continues only while more data shows up within idle_timeout;
     * a quiet line, EOF, a receive error or the cap ends the read.
     * 
     * @param fd Socket file descriptor
     * @param min_length Bytes to wait for unconditionally
     * @param max_length Cap on the returned payload
     * @param idle_timeout Longest gap tolerated once min_length is reached
     * @param out Received bytes are appended here
     * @return false only on a receive error before min_length bytes
     */
    static bool receiveResponse(int fd, size_t min_length, size_t max_length,
                                std::chrono::milliseconds idle_timeout, std::string& out);

    /**
     * Local port a socket is bound to
     * 
     * @return Port number, -1 on failure
     */
    static int localPort(int fd);

    /**
     * Remote endpoint of a connected socket as "address:port"
     */
    static std::string peerEndpoint(int fd);

    /**
     * Set socket timeout
     * 
     * Sets both send and receive timeouts.
     * 
     * @param fd Socket file descriptor
     * @param timeout Timeout, rounded to microseconds
     * @return true on success, false on failure
     */
    static bool setSocketTimeout(int fd, std::chrono::milliseconds timeout);

    /**
     * Get last socket error as string
     * 
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
