#ifndef BIDIRECTIONAL_RELAY_HPP
#define BIDIRECTIONAL_RELAY_HPP

#include "ProxyError.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * BidirectionalRelay - Copies bytes between client and origin until both sides finish
 *
 * The client->origin direction runs on its own thread, origin->client on the
 * calling thread. Each direction copies until its source reports end-of-stream
 * or an error, then half-closes its destination. run() returns only after both
 * directions have stopped. Neither socket is closed here.
 */
class BidirectionalRelay {
public:
    static constexpr size_t kChunkSize = 8192;

    /**
     * What happened in one direction
     */
    struct DirectionReport {
        uint64_t bytes = 0;
        ProxyError error = ProxyError::None;  // None when the source reached end-of-stream
        std::string detail;
    };

    struct Report {
        DirectionReport upstream;    // client -> origin
        DirectionReport downstream;  // origin -> client

        /** First recorded error, upstream before downstream */
        ProxyError firstError() const;
    };

    /**
     * Relay until both directions terminate
     *
     * @param client_fd Client socket
     * @param origin_fd Origin socket
     * @param idle_timeout_seconds Give up once neither direction has moved a byte
     *        for this long; 0 disables the timeout
     * @return Per-direction byte counts and errors
     */
    static Report run(int client_fd, int origin_fd, int idle_timeout_seconds);

private:
    /**
     * Copy src -> dst until end-of-stream or error, then half-close dst
     */
    static void copyStream(int src_fd, int dst_fd, int idle_timeout_seconds,
                           std::atomic<int64_t>& last_activity_ms,
                           DirectionReport& report);

    static int64_t nowMillis();
};

#endif // BIDIRECTIONAL_RELAY_HPP
