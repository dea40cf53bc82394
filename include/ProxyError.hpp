#ifndef PROXY_ERROR_HPP
#define PROXY_ERROR_HPP

/**
 * ProxyError - Failure kinds reported by the connection engine
 *
 * Every stage of a proxied connection reports one of these values instead of
 * throwing. A failure only ever ends the connection that produced it.
 */
enum class ProxyError {
    None,

    // Listener
    ListenFailure,
    AcceptFailure,

    // Initial read
    ClientReadFailure,

    // Request line
    MissingRequestLine,
    MissingMethod,
    MissingTarget,
    UnknownMethod,

    // Target resolution
    MalformedUrl,
    MalformedConnectTarget,
    MissingHost,
    MissingPort,

    // Handshake
    OriginUnreachable,
    HandshakeWriteFailed,

    // Relay
    RelayIOFailure,
    RelayTimeout
};

/**
 * Stable, human-readable name of an error kind (used in log lines)
 */
const char* describe(ProxyError error);

/**
 * True for every failure raised while parsing or resolving the request line
 */
bool isParseFailure(ProxyError error);

#endif // PROXY_ERROR_HPP
