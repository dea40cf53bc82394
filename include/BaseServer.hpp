#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <atomic>
#include <string>

#include "ProxyError.hpp"


class BaseServer{
public:
    BaseServer(const std::string& bind_address, int port);
    virtual ~BaseServer();

    BaseServer(const BaseServer&) = delete;
    BaseServer& operator=(const BaseServer&) = delete;

    // Bind, listen, then accept until stop() is called.
    // Returns false if the listener could not be set up or became unusable.
    bool start();

    // Bind and listen only. Port 0 picks an ephemeral port.
    bool bindAndListen();

    // Accept loop; one detached thread per client.
    bool acceptLoop();

    // Wake the accept loop and make it return. Safe from any thread.
    void stop();

    int acceptConnection(std::string& peer);

    int boundPort() const { return bound_port.load(); }
    int activeConnections() const { return active_connections.load(); }

    // ListenFailure or AcceptFailure after the most recent listener error, else None.
    ProxyError lastError() const { return last_error.load(); }
    int acceptFailures() const { return accept_failures.load(); }

protected:
    std::atomic<int> socket_fd{-1};
    std::string bind_address;
    int server_port;

    // Takes ownership of client_fd and must close it.
    virtual void handleRequest(int client_fd, const std::string& peer) = 0;

private:
    std::atomic<bool> running{false};
    std::atomic<int> bound_port{0};
    std::atomic<int> active_connections{0};
    std::atomic<ProxyError> last_error{ProxyError::None};
    std::atomic<int> accept_failures{0};

    bool listenFailed(int fd, const std::string& reason);

    static void* threadEntry(void* arg);
    void threadHandler(int client_fd, const std::string& peer);
};

#endif // BASE_SERVER_HPP
