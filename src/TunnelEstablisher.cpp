#include "TunnelEstablisher.hpp"
#include "NetworkUtils.hpp"

#include <unistd.h>
#include <fmt/format.h>
#include <iostream>

// ====================================================================================================
// Public Methods
// ====================================================================================================

TunnelEstablisher::Result TunnelEstablisher::establish(int client_fd,
                                                       const TargetResolver::Target& target,
                                                       TunnelMode mode,
                                                       std::string_view initial_bytes,
                                                       int connect_timeout_seconds) {
    Result result;

    // Step 1: Connect to destination server using NetworkUtils
    int server_fd = NetworkUtils::connectToHost(target.host, target.port, connect_timeout_seconds);
    if (server_fd < 0) {
        result.error = ProxyError::OriginUnreachable;
        result.detail = fmt::format("could not connect to {}:{}", target.host, target.port);
        return result;
    }

    // Step 2: Either acknowledge the tunnel or replay what the client sent
    bool sent = false;
    if (mode == TunnelMode::Connect) {
        sent = NetworkUtils::sendData(client_fd, kConnectEstablished);
        if (!sent) {
            result.detail = "failed to send tunnel acknowledgment to client";
        }

        // Bytes the client pipelined behind its CONNECT headers belong to the tunnel
        size_t header_end = HTTPRequestParser::headerBlockEnd(initial_bytes);
        if (sent && header_end != std::string_view::npos && header_end < initial_bytes.size()) {
            sent = NetworkUtils::sendData(server_fd, initial_bytes.substr(header_end));
            if (!sent) {
                result.detail = fmt::format("failed to forward early tunnel data to {}:{}",
                                            target.host, target.port);
            }
        }
    } else {
        sent = NetworkUtils::sendData(server_fd, initial_bytes);
        if (!sent) {
            result.detail = fmt::format("failed to forward {} request bytes to {}:{}",
                                        initial_bytes.size(), target.host, target.port);
        }
    }

    if (!sent) {
        std::cerr << "[TunnelEstablisher] " << result.detail << "\n";
        close(server_fd);
        result.error = ProxyError::HandshakeWriteFailed;
        return result;
    }

    result.origin_fd = server_fd;
    return result;
}

TunnelMode TunnelEstablisher::modeFor(HttpMethod method) {
    return method == HttpMethod::Connect ? TunnelMode::Connect : TunnelMode::Http;
}
