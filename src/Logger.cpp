#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>

// Serialize concurrent writes across all Logger instances
static std::mutex g_log_file_mutex;
static std::string g_log_file = "logs/log.txt";
static bool g_console_echo = true;
static bool g_open_error_reported = false; // per configured path

// Sanitize a request line (trim CRLF, keep printable ASCII/whitespace, cap length)
static std::string sanitize_http_line(std::string_view s) {
    // Trim at first CRLF
    if (auto p = s.find("\r\n"); p != std::string_view::npos)
        s = s.substr(0, p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        // drop other control/binary
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given client
Logger::Logger(std::string clientID) : clientID(std::move(clientID)) {}

void Logger::configure(const std::string& logFile, bool consoleEcho) {
    std::lock_guard<std::mutex> lock(g_log_file_mutex);
    g_log_file = logFile;
    g_console_echo = consoleEcho;
    g_open_error_reported = false;

    // Ensure the log directory exists (safe if it already exists)
    if (!g_log_file.empty()) {
        std::error_code ec;
        std::filesystem::path parent = std::filesystem::path(g_log_file).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
    }
}

std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

void Logger::logAccepted(const std::string& peer){
    write(fmt::format("Accepted connection from {}", peer));
}

void Logger::logRequest(std::string_view requestLine){
    write("Request: " + sanitize_http_line(requestLine));
}

void Logger::logTargetResolved(const std::string& host, int port){
    write(fmt::format("Target resolved to {}:{}", host, port));
}

void Logger::logTunnelEstablished(const std::string& host, int port){
    write(fmt::format("Tunnel established to {}:{}", host, port));
}

void Logger::logRequestForwarded(const std::string& host, int port, size_t bytes){
    write(fmt::format("Forwarded {} initial bytes to {}:{}", bytes, host, port));
}

void Logger::logFailure(ProxyError error, std::string_view detail){
    if (detail.empty())
        write(fmt::format("ERROR {}", describe(error)));
    else
        write(fmt::format("ERROR {}: {}", describe(error), sanitize_http_line(detail)));
}

void Logger::logRelaySummary(uint64_t bytesUp, uint64_t bytesDown, double seconds){
    write(fmt::format("SUMMARY up={}b down={}b dur={:.2f}s", bytesUp, bytesDown, seconds));
}

void Logger::logConnectionClosed(const std::string& host, int port){
    write(fmt::format("Connection closed for {}:{}", host, port));
}



void Logger::write(const std::string& entry){
    const std::string line = fmt::format("{} [{}]: {}", getTime(), clientID, entry);

    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    if (g_console_echo)
        std::cout << line << std::endl;

    if (g_log_file.empty())
        return;

    std::ofstream out(g_log_file, std::ios::app); //Open in append mode
    if (!out){
        if (!g_open_error_reported) {
            g_open_error_reported = true;
            std::cerr << "[Logger] ERROR: cannot open " << g_log_file << "\n";
        }
        return;
    }
    out << line << '\n';
}
