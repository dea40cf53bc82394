#include <iostream>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <arpa/inet.h>
#include <unistd.h>
#include <pthread.h>

#include "BaseServer.hpp"
#include "NetworkUtils.hpp"

namespace {

struct ThreadArgs {
    BaseServer* server;
    int client_fd;
    std::string peer;
};

} // namespace


BaseServer::BaseServer(const std::string& bind_address, int port)
    : bind_address{bind_address}, server_port{port} {}

BaseServer::~BaseServer() {
    int fd = socket_fd.exchange(-1);
    if (fd != -1) {
        close(fd);
        std::cout << "Server shut down.\n";
    }
}

bool BaseServer::start() {
    if (!bindAndListen()) {
        return false;
    }
    return acceptLoop();
}

bool BaseServer::bindAndListen() {
    // Create a TCP Socket
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return listenFailed(fd, "failed to create socket");
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return listenFailed(fd, "failed to set socket options");
    }

    // Prepare the sockaddr_in Structure
    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(server_port);
    if (inet_pton(AF_INET, bind_address.c_str(), &server_addr.sin_addr) != 1) {
        return listenFailed(fd, "invalid bind address " + bind_address);
    }

    // Bind the Socket to the Port
    if (bind(fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        return listenFailed(fd, "failed to bind to " + bind_address + ":" +
                                    std::to_string(server_port) + " (" +
                                    NetworkUtils::getLastError() + ")");
    }

    // Start Listening for Incoming Connections
    if (listen(fd, SOMAXCONN) < 0) {
        return listenFailed(fd, "failed to listen on port " + std::to_string(server_port));
    }

    // Find out which port we got (matters for port 0)
    sockaddr_in bound_addr{};
    socklen_t bound_len = sizeof(bound_addr);
    if (getsockname(fd, (struct sockaddr*)&bound_addr, &bound_len) < 0) {
        return listenFailed(fd, "failed to query bound address");
    }

    socket_fd.store(fd);
    last_error.store(ProxyError::None);
    running.store(true);
    bound_port.store(ntohs(bound_addr.sin_port));
    return true;
}

bool BaseServer::acceptLoop() {
    // Accept Incoming Connections
    std::cout << "Server listening on " << bind_address << ":" << boundPort() << ".\n";
    while (running.load()) {
        std::string peer;
        int client_fd = acceptConnection(peer);
        if (client_fd < 0) {
            if (!running.load()) {
                break;  // stop() woke us up
            }
            if (errno == EBADF || errno == EINVAL || errno == ENOTSOCK) {
                last_error.store(ProxyError::ListenFailure);
                std::cerr << "Error: " << describe(ProxyError::ListenFailure)
                          << ": listening socket is no longer usable\n";
                return false;
            }
            if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                // Out of descriptors; give in-flight connections a chance to finish
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue; // Accept failed, try again
        }

        // Create a New Thread for Each Client
        auto* args = new ThreadArgs{this, client_fd, peer};
        active_connections.fetch_add(1);
        pthread_t thread_id;
        if (pthread_create(&thread_id, nullptr, BaseServer::threadEntry, args) != 0) {
            std::cerr << "Error: Failed to create thread\n";
            active_connections.fetch_sub(1);
            close(client_fd);
            delete args;
            continue;
        }

        pthread_detach(thread_id); // Auto-clean threads
    }

    std::cout << "Server stopped accepting.\n";
    return true;
}

void BaseServer::stop() {
    running.store(false);
    int fd = socket_fd.load();
    if (fd != -1) {
        // Unblocks accept() with EINVAL
        shutdown(fd, SHUT_RDWR);
    }
}

int BaseServer::acceptConnection(std::string& peer) {
    // Prepare to Accept a Connection
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Accept the Incoming Connection
    int client_fd = accept(socket_fd.load(), (struct sockaddr*)&client_addr, &client_len);
    if (client_fd < 0) {
        int saved = errno;
        if (running.load()) {
            last_error.store(ProxyError::AcceptFailure);
            accept_failures.fetch_add(1);
            std::cerr << "Error: " << describe(ProxyError::AcceptFailure) << " ("
                      << strerror(saved) << ")\n";
        }
        errno = saved;
        return -1;
    }

    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
    peer = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
    return client_fd;
}

bool BaseServer::listenFailed(int fd, const std::string& reason) {
    int saved = errno;
    if (fd >= 0) {
        close(fd);
    }
    last_error.store(ProxyError::ListenFailure);
    std::cerr << "Error: " << describe(ProxyError::ListenFailure) << ": " << reason << "\n";
    errno = saved;
    return false;
}

void* BaseServer::threadEntry(void* arg) {
    auto* args = static_cast<ThreadArgs*>(arg);
    BaseServer* server = args->server;
    int client_fd = args->client_fd;
    std::string peer = std::move(args->peer);
    delete args;

    server->threadHandler(client_fd, peer);

    return nullptr;
}

void BaseServer::threadHandler(int client_fd, const std::string& peer) {
    handleRequest(client_fd, peer);   // closes client_fd
    active_connections.fetch_sub(1);
}
