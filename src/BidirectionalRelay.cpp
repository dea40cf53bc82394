#include "BidirectionalRelay.hpp"
#include "NetworkUtils.hpp"

#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <system_error>
#include <thread>

// ====================================================================================================
// Public Methods
// ====================================================================================================

ProxyError BidirectionalRelay::Report::firstError() const {
    return upstream.error != ProxyError::None ? upstream.error : downstream.error;
}

BidirectionalRelay::Report BidirectionalRelay::run(int client_fd, int origin_fd,
                                                   int idle_timeout_seconds) {
    Report report;

    // The same timeout bounds every blocking read and write of the relay
    if (!NetworkUtils::setSocketTimeout(client_fd, idle_timeout_seconds) ||
        !NetworkUtils::setSocketTimeout(origin_fd, idle_timeout_seconds)) {
        report.upstream.error = ProxyError::RelayIOFailure;
        report.upstream.detail = "could not set relay timeouts: " + NetworkUtils::getLastError();
        report.downstream = report.upstream;
        return report;
    }

    std::atomic<int64_t> last_activity_ms{nowMillis()};

    std::thread upstream;
    try {
        upstream = std::thread([&] {
            copyStream(client_fd, origin_fd, idle_timeout_seconds, last_activity_ms,
                       report.upstream);
        });
    } catch (const std::system_error& e) {
        report.upstream.error = ProxyError::RelayIOFailure;
        report.upstream.detail = fmt::format("could not start relay thread: {}", e.what());
        report.downstream.error = ProxyError::RelayIOFailure;
        report.downstream.detail = report.upstream.detail;
        return report;
    }

    copyStream(origin_fd, client_fd, idle_timeout_seconds, last_activity_ms,
               report.downstream);

    upstream.join();
    return report;
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

void BidirectionalRelay::copyStream(int src_fd, int dst_fd, int idle_timeout_seconds,
                                    std::atomic<int64_t>& last_activity_ms,
                                    DirectionReport& report) {
    char buf[kChunkSize];
    const int64_t idle_limit_ms = static_cast<int64_t>(idle_timeout_seconds) * 1000;
    bool read_failed = false;

    while (true) {
        ssize_t n = NetworkUtils::receiveData(src_fd, buf, sizeof(buf));

        if (n == 0) {
            break;  // End-of-stream
        }

        if (n < 0) {
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && idle_limit_ms > 0) {
                // Only idle if the other direction has been quiet too
                if (nowMillis() - last_activity_ms.load() < idle_limit_ms) {
                    continue;
                }
                report.error = ProxyError::RelayTimeout;
                report.detail = fmt::format("no traffic for {}s", idle_timeout_seconds);
                break;
            }
            report.error = ProxyError::RelayIOFailure;
            report.detail = "recv failed: " + NetworkUtils::getLastError();
            read_failed = true;
            break;
        }

        last_activity_ms.store(nowMillis());

        if (!NetworkUtils::sendData(dst_fd, buf, static_cast<size_t>(n))) {
            report.error = ProxyError::RelayIOFailure;
            report.detail = "send failed: " + NetworkUtils::getLastError();
            break;
        }
        report.bytes += static_cast<uint64_t>(n);
    }

    if (read_failed) {
        // The source is broken (e.g. reset); wake the other direction blocked on dst
        NetworkUtils::shutdownBoth(dst_fd);
    } else {
        NetworkUtils::shutdownWrite(dst_fd);
    }
}

int64_t BidirectionalRelay::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}
