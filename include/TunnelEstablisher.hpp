#ifndef TUNNEL_ESTABLISHER_HPP
#define TUNNEL_ESTABLISHER_HPP

#include "HTTPRequestParser.hpp"
#include "ProxyError.hpp"
#include "TargetResolver.hpp"

#include <string>
#include <string_view>

/**
 * How the connection is handed to the origin once dialed
 */
enum class TunnelMode {
    Http,     // Replay the client's initial bytes to the origin
    Connect   // Acknowledge the tunnel to the client
};

/**
 * TunnelEstablisher - Dials the origin and performs the pre-relay handshake
 *
 * Responsibilities:
 * - Connect to the resolved destination (via NetworkUtils)
 * - CONNECT: send "200 Connection established" to the client, only after a
 *   successful dial, then pass on any bytes pipelined after the headers
 * - HTTP: forward the bytes already read from the client verbatim
 *
 * On any failure the origin socket (if opened) is closed before returning and
 * nothing has been relayed. The client socket is never closed here.
 */
class TunnelEstablisher {
public:
    /** Exact acknowledgment sent to CONNECT clients */
    static constexpr std::string_view kConnectEstablished =
        "HTTP/1.1 200 Connection established\r\n\r\n";

    struct Result {
        int origin_fd = -1;
        ProxyError error = ProxyError::None;
        std::string detail;

        bool valid() const { return error == ProxyError::None; }
    };

    /**
     * Establish the origin connection
     *
     * @param client_fd Client socket file descriptor
     * @param target Resolved destination
     * @param mode HTTP replay or CONNECT acknowledgment
     * @param initial_bytes Bytes already read from the client: replayed whole in
     *        HTTP mode, only the part after the header block in CONNECT mode
     * @param connect_timeout_seconds Dial timeout, 0 waits indefinitely
     * @return Result holding the connected origin socket, or the failure kind
     */
    static Result establish(int client_fd,
                            const TargetResolver::Target& target,
                            TunnelMode mode,
                            std::string_view initial_bytes,
                            int connect_timeout_seconds);

    /**
     * CONNECT requests tunnel, everything else is replayed
     */
    static TunnelMode modeFor(HttpMethod method);
};

#endif // TUNNEL_ESTABLISHER_HPP
