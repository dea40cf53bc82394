#ifndef CONNECTION_SUPERVISOR_HPP
#define CONNECTION_SUPERVISOR_HPP

#include "BidirectionalRelay.hpp"
#include "HTTPRequestParser.hpp"
#include "Logger.hpp"
#include "ProxyConfig.hpp"
#include "ProxyError.hpp"
#include "TargetResolver.hpp"

#include <string>
#include <vector>

/**
 * Lifecycle of one proxied connection
 */
enum class ConnectionState {
    Accepted,
    Parsing,
    Resolving,
    Handshaking,
    Relaying,
    Closed,
    Failed
};

/**
 * ConnectionSupervisor - Drives one accepted client connection from request line to close
 *
 * Accepted -> Parsing -> Resolving -> Handshaking -> Relaying -> Closed, or
 * straight to Failed from any non-terminal state. The supervisor owns the
 * client socket: it is closed exactly once when run() returns (or, if run()
 * is never called, on destruction). Nothing that happens here is reported
 * beyond the returned Outcome and the log.
 */
class ConnectionSupervisor {
public:
    /**
     * Structured result of a connection, for diagnostics
     */
    struct Outcome {
        ConnectionState state = ConnectionState::Accepted;
        ProxyError error = ProxyError::None;
        std::string detail;
        HttpMethod method = HttpMethod::Unknown;
        TargetResolver::Target target;
        BidirectionalRelay::Report relay;
    };

    /**
     * @param client_fd Accepted client socket; ownership passes to the supervisor
     * @param config Timeouts to apply
     * @param logger Per-connection logger
     */
    ConnectionSupervisor(int client_fd, const ProxyConfig& config, Logger& logger);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * Run the connection to completion. Call once.
     */
    Outcome run();

    ConnectionState state() const { return current_state; }

    /** Every state entered, starting with Accepted */
    const std::vector<ConnectionState>& history() const { return transitions; }

    static const char* stateName(ConnectionState state);

private:
    int client_fd;
    ProxyConfig config;
    Logger& logger;

    ConnectionState current_state = ConnectionState::Accepted;
    std::vector<ConnectionState> transitions;
    Outcome outcome;

    void transition(ConnectionState next);
    Outcome fail(ProxyError error, std::string detail);
    void closeClient();
};

#endif // CONNECTION_SUPERVISOR_HPP
