#include "HTTPRequestParser.hpp"
#include "NetworkUtils.hpp"
#include "StringUtils.hpp"

#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <iostream>
#include <vector>

using namespace utils;

// ============================================================================
// Reading
// ============================================================================

bool HTTPRequestParser::readInitialRequest(int client_fd, std::string& buffer) {
    buffer.clear();
    char chunk[kMaxInitialRead];

    while (buffer.size() < kMaxInitialRead) {
        ssize_t n = recv(client_fd, chunk, kMaxInitialRead - buffer.size(), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[HTTPRequestParser] Initial read failed: "
                      << NetworkUtils::getLastError() << "\n";
            return false;
        }
        if (n == 0) {
            return true;  // Peer closed; let parse() decide
        }

        // A CRLF may straddle two reads, so look back one byte
        size_t search_from = buffer.empty() ? 0 : buffer.size() - 1;
        buffer.append(chunk, static_cast<size_t>(n));
        if (buffer.find("\r\n", search_from) != std::string::npos) {
            return true;
        }
    }

    return true;
}

void HTTPRequestParser::drainHeaderBlock(int client_fd, std::string& buffer) {
    char chunk[kMaxInitialRead];

    while (buffer.size() < kMaxHeaderBlock && headerBlockEnd(buffer) == std::string_view::npos) {
        size_t room = std::min(sizeof(chunk), kMaxHeaderBlock - buffer.size());
        ssize_t n = recv(client_fd, chunk, room, MSG_DONTWAIT);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;  // Nothing queued yet, or the relay will see the close/error
        }
        // Bytes past the blank line are forwarded by TunnelEstablisher
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

size_t HTTPRequestParser::headerBlockEnd(std::string_view buffer) {
    size_t pos = buffer.find("\r\n\r\n");
    return pos == std::string_view::npos ? pos : pos + 4;
}

// ============================================================================
// Parsing
// ============================================================================

HTTPRequestParser::ParsedRequest HTTPRequestParser::parse(std::string_view buffer) {
    ParsedRequest request;
    request.raw.assign(buffer.data(), buffer.size());

    size_t eol = buffer.find("\r\n");
    if (eol == std::string_view::npos) {
        request.error = ProxyError::MissingRequestLine;
        return request;
    }

    std::vector<std::string_view> tokens = split(buffer.substr(0, eol), ' ');

    if (tokens[0].empty()) {
        request.error = ProxyError::MissingMethod;
        return request;
    }
    request.method_token = std::string{tokens[0]};

    if (tokens.size() < 2 || tokens[1].empty()) {
        request.error = ProxyError::MissingTarget;
        return request;
    }
    request.target = std::string{tokens[1]};

    request.method = classifyMethod(tokens[0]);
    if (request.method == HttpMethod::Unknown) {
        request.error = ProxyError::UnknownMethod;
    }

    return request;
}

HttpMethod HTTPRequestParser::classifyMethod(std::string_view token) {
    if (token == "GET")     return HttpMethod::Get;
    if (token == "POST")    return HttpMethod::Post;
    if (token == "PUT")     return HttpMethod::Put;
    if (token == "DELETE")  return HttpMethod::Delete;
    if (token == "HEAD")    return HttpMethod::Head;
    if (token == "OPTIONS") return HttpMethod::Options;
    if (token == "CONNECT") return HttpMethod::Connect;
    return HttpMethod::Unknown;
}

const char* HTTPRequestParser::methodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Options: return "OPTIONS";
        case HttpMethod::Connect: return "CONNECT";
        case HttpMethod::Unknown: break;
    }
    return "UNKNOWN";
}

std::string_view HTTPRequestParser::firstLine(std::string_view buffer) {
    size_t eol = buffer.find("\r\n");
    return eol == std::string_view::npos ? buffer : buffer.substr(0, eol);
}
