#include "HTTPProxyServer.hpp"
#include "ConnectionSupervisor.hpp"
#include "Logger.hpp"

#include <string>

// ====================================================================================================
// Constructor
// ====================================================================================================
HTTPProxyServer::HTTPProxyServer(const ProxyConfig& config)
    : BaseServer(config.bind_address, config.port), config(config) {}

// ====================================================================================================
// Main Request Handler
// ====================================================================================================
void HTTPProxyServer::handleRequest(int client_fd, const std::string& peer) {
    Logger logger(std::to_string(client_fd));
    logger.logAccepted(peer);

    ConnectionSupervisor supervisor(client_fd, config, logger);
    supervisor.run();
}
