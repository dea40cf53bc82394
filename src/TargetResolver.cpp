#include "TargetResolver.hpp"
#include "StringUtils.hpp"

#include <cctype>

using namespace utils;

// ============================================================================
// Public Methods
// ============================================================================

TargetResolver::Target TargetResolver::resolve(const HTTPRequestParser::ParsedRequest& request) {
    switch (request.method) {
        case HttpMethod::Connect:
            return resolveConnectTarget(request.target);
        case HttpMethod::Get:
        case HttpMethod::Post:
        case HttpMethod::Put:
        case HttpMethod::Delete:
        case HttpMethod::Head:
        case HttpMethod::Options:
            return resolveAbsoluteUrl(request.target);
        case HttpMethod::Unknown:
            break;
    }
    return failure(ProxyError::UnknownMethod, request.method_token);
}

TargetResolver::Target TargetResolver::resolveAbsoluteUrl(std::string_view url) {
    // Scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    size_t colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0 ||
        !std::isalpha(static_cast<unsigned char>(url[0]))) {
        return failure(ProxyError::MalformedUrl, url);  // Relative or no scheme
    }
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return failure(ProxyError::MalformedUrl, url);
        }
    }
    std::string scheme = toLower(url.substr(0, colon));

    // Without an authority ("mailto:x") there is no host to dial
    std::string_view rest = url.substr(colon + 1);
    if (rest.substr(0, 2) != "//") {
        return failure(ProxyError::MissingHost, url);
    }
    rest.remove_prefix(2);

    std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));

    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view port_text;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return failure(ProxyError::MalformedUrl, url);
        }
        host = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return failure(ProxyError::MalformedUrl, url);
            }
            port_text = after.substr(1);
        }
        for (char c : host) {
            if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.') {
                return failure(ProxyError::MalformedUrl, url);
            }
        }
    } else {
        size_t port_colon = authority.find(':');
        host = authority.substr(0, port_colon);
        if (port_colon != std::string_view::npos) {
            port_text = authority.substr(port_colon + 1);
        }
        for (char c : host) {
            if (!isValidHostChar(c)) {
                return failure(ProxyError::MalformedUrl, url);
            }
        }
    }

    if (host.empty()) {
        return failure(ProxyError::MissingHost, url);
    }

    Target target;
    target.host = toLower(host);

    // "http://host:/" carries an empty port, which means the default
    if (port_text.empty()) {
        target.port = defaultPortForScheme(scheme);
        if (target.port < 0) {
            return failure(ProxyError::MissingPort, url);
        }
    } else {
        target.port = parsePort(port_text);
        if (target.port < 0) {
            return failure(ProxyError::MalformedUrl, url);
        }
    }

    return target;
}

TargetResolver::Target TargetResolver::resolveConnectTarget(std::string_view authority) {
    size_t search_from = 0;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return failure(ProxyError::MalformedConnectTarget, authority);
        }
        search_from = close;
    }

    size_t colon = authority.find(':', search_from);
    if (colon == std::string_view::npos) {
        return failure(ProxyError::MissingPort, authority);
    }

    std::string_view host = authority.substr(0, colon);
    std::string_view port_text = authority.substr(colon + 1);

    if (search_from != 0) {
        // "[::1]:443" - the colon must follow the bracket directly
        if (colon != search_from + 1) {
            return failure(ProxyError::MalformedConnectTarget, authority);
        }
        host = host.substr(1, host.size() - 2);
    }

    if (host.empty()) {
        return failure(ProxyError::MissingHost, authority);
    }
    if (port_text.empty()) {
        return failure(ProxyError::MissingPort, authority);
    }

    Target target;
    target.host = std::string{host};
    target.port = parsePort(port_text);
    if (target.port < 0) {
        return failure(ProxyError::MalformedConnectTarget, authority);
    }
    return target;
}

int TargetResolver::defaultPortForScheme(std::string_view scheme) {
    if (scheme == "http" || scheme == "ws")   return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    if (scheme == "ftp")                      return 21;
    return -1;
}

// ============================================================================
// Private Helper Methods
// ============================================================================

TargetResolver::Target TargetResolver::failure(ProxyError error, std::string_view offending) {
    Target target;
    target.error = error;
    target.offending = std::string{offending};
    return target;
}

bool TargetResolver::isValidHostChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
        return true;
    }
    switch (c) {
        case '-': case '.': case '_': case '~': case '%':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}
