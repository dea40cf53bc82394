#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/types.h>

/**
 * NetworkUtils - Common networking utility functions
 *
 * Provides reusable networking operations used across multiple components:
 * - Making outbound TCP connections (bounded by a timeout)
 * - Sending data with error checking
 * - Receiving data with error handling
 * - Socket timeouts and half-close
 *
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Connect to a remote host
     *
     * Performs DNS resolution and tries every returned address in turn.
     * Supports both IPv4 and IPv6.
     *
     * @param host Hostname or IP address
     * @param port Port number
     * @param timeout_seconds Per-address connect timeout, 0 waits indefinitely
     * @return Socket file descriptor on success, -1 on failure
     */
    static int connectToHost(const std::string& host, int port, int timeout_seconds = 0);

    /**
     * Send complete data to socket
     *
     * Ensures all data is sent or returns error.
     * Handles partial sends automatically. Never raises SIGPIPE.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Send string data to socket
     */
    static bool sendData(int fd, std::string_view data);

    /**
     * Receive up to max_length bytes from socket
     *
     * Retries when interrupted by a signal.
     *
     * @return Number of bytes received, 0 on EOF, -1 on error (errno preserved)
     */
    static ssize_t receiveData(int fd, char* buffer, size_t max_length);

    /**
     * Set socket timeout
     *
     * Sets both send and receive timeouts. 0 clears them.
     *
     * @param fd Socket file descriptor
     * @param seconds Timeout in seconds
     * @return true on success, false on failure
     */
    static bool setSocketTimeout(int fd, int seconds);

    /**
     * Set only the receive timeout. 0 clears it.
     */
    static bool setReceiveTimeout(int fd, int seconds);

    /**
     * Half-close: shut down the write side so the peer reads end-of-stream
     */
    static void shutdownWrite(int fd);

    /**
     * Shut down both halves of a socket, waking any thread blocked reading it
     *
     * @param fd Socket file descriptor
     */
    static void shutdownBoth(int fd);

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

    static bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t addr_len,
                                   int timeout_seconds);
};

#endif // NETWORK_UTILS_HPP
