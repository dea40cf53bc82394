#include "NetworkUtils.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToHost(const std::string& host, int port, int timeout_seconds) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;      // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        std::cerr << "[NetworkUtils] DNS resolution failed for " << host
                  << ": " << gai_strerror(err) << "\n";
        return -1;
    }

    int sock_fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        // Create socket
        sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_fd < 0) {
            std::cerr << "[NetworkUtils] Failed to create socket: "
                      << strerror(errno) << "\n";
            continue;
        }

        // Connect to remote host
        if (connectWithTimeout(sock_fd, ai->ai_addr, ai->ai_addrlen, timeout_seconds)) {
            break;
        }

        std::cerr << "[NetworkUtils] Failed to connect to "
                  << host << ":" << port
                  << " (" << strerror(errno) << ")\n";
        close(sock_fd);
        sock_fd = -1;
    }

    freeaddrinfo(res);
    return sock_fd;
}

bool NetworkUtils::connectWithTimeout(int fd, const sockaddr* addr, socklen_t addr_len,
                                      int timeout_seconds) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }

    if (connect(fd, addr, addr_len) < 0) {
        if (errno != EINPROGRESS) {
            return false;
        }

        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int timeout_ms = timeout_seconds > 0 ? timeout_seconds * 1000 : -1;

        int ready;
        do {
            ready = poll(&pfd, 1, timeout_ms);
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            errno = ETIMEDOUT;
            return false;
        }
        if (ready < 0) {
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return false;
        }
        if (so_error != 0) {
            errno = so_error;
            return false;
        }
    }

    // Back to blocking mode for the handshake and relay
    return fcntl(fd, F_SETFL, flags) == 0;
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length) {
    size_t total_sent = 0;

    while (total_sent < length) {
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[NetworkUtils] Send failed: " << strerror(errno) << "\n";
            return false;
        }

        if (sent == 0) {
            std::cerr << "[NetworkUtils] Connection closed during send\n";
            return false;
        }

        total_sent += sent;
    }

    return true;
}

bool NetworkUtils::sendData(int fd, std::string_view data) {
    return sendData(fd, data.data(), data.size());
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

ssize_t NetworkUtils::receiveData(int fd, char* buffer, size_t max_length) {
    ssize_t received;
    do {
        received = recv(fd, buffer, max_length, 0);
    } while (received < 0 && errno == EINTR);

    return received;
}

// ====================================================================================================
// Socket Configuration
// ====================================================================================================

bool NetworkUtils::setSocketTimeout(int fd, int seconds) {
    if (!setReceiveTimeout(fd, seconds)) {
        return false;
    }

    struct timeval timeout {};
    timeout.tv_sec = seconds;

    // Set send timeout
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "[NetworkUtils] Failed to set send timeout: "
                  << strerror(errno) << "\n";
        return false;
    }

    return true;
}

bool NetworkUtils::setReceiveTimeout(int fd, int seconds) {
    struct timeval timeout {};
    timeout.tv_sec = seconds;

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "[NetworkUtils] Failed to set receive timeout: "
                  << strerror(errno) << "\n";
        return false;
    }

    return true;
}

void NetworkUtils::shutdownWrite(int fd) {
    // ENOTCONN once the peer has already gone; nothing left to signal
    shutdown(fd, SHUT_WR);
}

void NetworkUtils::shutdownBoth(int fd) {
    shutdown(fd, SHUT_RDWR);
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
