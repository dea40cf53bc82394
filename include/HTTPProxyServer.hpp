#ifndef HTTP_PROXY_SERVER_HPP
#define HTTP_PROXY_SERVER_HPP

#include "BaseServer.hpp"
#include "ProxyConfig.hpp"
#include <string>

/**
 * HTTPProxyServer - Multi-threaded forward HTTP/HTTPS proxy
 *
 * Features:
 * - HTTP proxying of absolute-URL requests (GET, POST, PUT, DELETE, HEAD, OPTIONS)
 * - HTTPS tunneling (CONNECT method), traffic never decrypted
 * - One thread per client; failures never leave the connection they hit
 *
 * Each accepted connection is handed to a fresh ConnectionSupervisor, which
 * delegates to:
 * - HTTPRequestParser: reads and parses the request line
 * - TargetResolver: finds the origin host and port
 * - TunnelEstablisher: dials the origin and performs the handshake
 * - BidirectionalRelay: copies bytes both ways until both sides finish
 */
class HTTPProxyServer : public BaseServer {
public:
    /**
     * Constructor
     * @param config Listen address, port and timeouts
     */
    explicit HTTPProxyServer(const ProxyConfig& config);

protected:
    /**
     * Handle a client connection
     * This is called by BaseServer for each accepted connection
     *
     * @param client_fd Client socket file descriptor (closed before returning)
     * @param peer Client address, for the log
     */
    void handleRequest(int client_fd, const std::string& peer) override;

private:
    const ProxyConfig config;
};

#endif // HTTP_PROXY_SERVER_HPP
