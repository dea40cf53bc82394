#include "ConnectionSupervisor.hpp"
#include "NetworkUtils.hpp"
#include "TunnelEstablisher.hpp"

#include <unistd.h>
#include <fmt/format.h>
#include <chrono>

// ====================================================================================================
// Constructor / Destructor
// ====================================================================================================

ConnectionSupervisor::ConnectionSupervisor(int client_fd, const ProxyConfig& config, Logger& logger)
    : client_fd{client_fd}, config{config}, logger{logger} {
    transitions.push_back(ConnectionState::Accepted);
}

ConnectionSupervisor::~ConnectionSupervisor() {
    closeClient();
}

// ====================================================================================================
// Connection Lifecycle
// ====================================================================================================

ConnectionSupervisor::Outcome ConnectionSupervisor::run() {
    // -------------------------------------------------------
    // STEP 1: Read and parse the request line
    // -------------------------------------------------------
    transition(ConnectionState::Parsing);

    if (!NetworkUtils::setReceiveTimeout(client_fd, config.read_timeout)) {
        return fail(ProxyError::ClientReadFailure, "could not set read timeout");
    }

    std::string initial;
    if (!HTTPRequestParser::readInitialRequest(client_fd, initial)) {
        return fail(ProxyError::ClientReadFailure,
                    fmt::format("no request line after {} bytes", initial.size()));
    }

    auto request = HTTPRequestParser::parse(initial);
    if (!request.valid()) {
        return fail(request.error, std::string{HTTPRequestParser::firstLine(initial)});
    }

    outcome.method = request.method;
    logger.logRequest(HTTPRequestParser::firstLine(initial));

    // -------------------------------------------------------
    // STEP 2: Resolve destination host and port
    // -------------------------------------------------------
    transition(ConnectionState::Resolving);

    auto target = TargetResolver::resolve(request);
    if (!target.valid()) {
        return fail(target.error, target.offending);
    }

    outcome.target = target;
    logger.logTargetResolved(target.host, target.port);

    // Headers already sent with a CONNECT must not reach the tunnel
    if (request.method == HttpMethod::Connect) {
        HTTPRequestParser::drainHeaderBlock(client_fd, request.raw);
    }

    // -------------------------------------------------------
    // STEP 3: Dial origin, acknowledge or replay
    // -------------------------------------------------------
    transition(ConnectionState::Handshaking);

    TunnelMode mode = TunnelEstablisher::modeFor(request.method);
    auto tunnel = TunnelEstablisher::establish(client_fd, target, mode, request.raw,
                                               config.connect_timeout);
    if (!tunnel.valid()) {
        return fail(tunnel.error, tunnel.detail);
    }

    if (mode == TunnelMode::Connect) {
        logger.logTunnelEstablished(target.host, target.port);
    } else {
        logger.logRequestForwarded(target.host, target.port, request.raw.size());
    }

    // -------------------------------------------------------
    // STEP 4: Relay until both directions finish
    // -------------------------------------------------------
    transition(ConnectionState::Relaying);

    auto t_start = std::chrono::steady_clock::now();
    outcome.relay = BidirectionalRelay::run(client_fd, tunnel.origin_fd, config.idle_timeout);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t_start;

    close(tunnel.origin_fd);
    closeClient();

    if (outcome.relay.upstream.error != ProxyError::None) {
        logger.logFailure(outcome.relay.upstream.error,
                          "client->origin " + outcome.relay.upstream.detail);
    }
    if (outcome.relay.downstream.error != ProxyError::None) {
        logger.logFailure(outcome.relay.downstream.error,
                          "origin->client " + outcome.relay.downstream.detail);
    }
    logger.logRelaySummary(outcome.relay.upstream.bytes, outcome.relay.downstream.bytes,
                           elapsed.count());

    // Relay errors are diagnostics only; the connection still ran its course
    outcome.error = outcome.relay.firstError();
    if (outcome.relay.upstream.error != ProxyError::None) {
        outcome.detail = outcome.relay.upstream.detail;
    } else if (outcome.relay.downstream.error != ProxyError::None) {
        outcome.detail = outcome.relay.downstream.detail;
    }

    transition(ConnectionState::Closed);
    logger.logConnectionClosed(target.host, target.port);
    return outcome;
}

const char* ConnectionSupervisor::stateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Accepted:    return "Accepted";
        case ConnectionState::Parsing:     return "Parsing";
        case ConnectionState::Resolving:   return "Resolving";
        case ConnectionState::Handshaking: return "Handshaking";
        case ConnectionState::Relaying:    return "Relaying";
        case ConnectionState::Closed:      return "Closed";
        case ConnectionState::Failed:      return "Failed";
    }
    return "?";
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

void ConnectionSupervisor::transition(ConnectionState next) {
    current_state = next;
    transitions.push_back(next);
    outcome.state = next;
}

ConnectionSupervisor::Outcome ConnectionSupervisor::fail(ProxyError error, std::string detail) {
    logger.logFailure(error, detail);
    closeClient();

    outcome.error = error;
    outcome.detail = std::move(detail);
    transition(ConnectionState::Failed);
    return outcome;
}

void ConnectionSupervisor::closeClient() {
    if (client_fd >= 0) {
        close(client_fd);
        client_fd = -1;
    }
}
