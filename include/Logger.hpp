#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "ProxyError.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

class Logger {
    public:
        explicit Logger(std::string clientID);

        // Process-wide sink settings. An empty path disables the log file.
        static void configure(const std::string& logFile, bool consoleEcho);

        void logAccepted(const std::string& peer); //Log a newly accepted client
        void logRequest(std::string_view requestLine); //Log the (sanitized) request line
        void logTargetResolved(const std::string& host, int port); //Log the resolved destination
        void logTunnelEstablished(const std::string& host, int port); //Log CONNECT acknowledgment
        void logRequestForwarded(const std::string& host, int port, size_t bytes); //Log HTTP replay
        void logFailure(ProxyError error, std::string_view detail); //Log a failure kind
        void logRelaySummary(uint64_t bytesUp, uint64_t bytesDown, double seconds);
        void logConnectionClosed(const std::string& host, int port); //Log connection closure
    private:
        std::string clientID;
        static std::string getTime();
        void write(const std::string& entry);
};

#endif // LOGGER_HPP
