#ifndef TARGET_RESOLVER_HPP
#define TARGET_RESOLVER_HPP

#include "HTTPRequestParser.hpp"
#include "ProxyError.hpp"

#include <string>
#include <string_view>

/**
 * TargetResolver - Turns a parsed request target into the (host, port) to dial
 *
 * Handles both:
 * - Absolute URLs: GET http://example.com:8080/path HTTP/1.1
 * - CONNECT authorities: CONNECT example.com:443 HTTP/1.1
 */
class TargetResolver {
public:
    /**
     * Represents a resolved destination
     */
    struct Target {
        std::string host;
        int port = 0;
        ProxyError error = ProxyError::None;
        std::string offending;  // Input that failed to resolve, for diagnostics

        bool valid() const { return error == ProxyError::None; }
    };

    /**
     * Resolve the destination of a successfully parsed request
     *
     * CONNECT targets go through resolveConnectTarget(), every other
     * recognised method through resolveAbsoluteUrl().
     *
     * @param request Parsed request line
     * @return Target, with error set on failure
     */
    static Target resolve(const HTTPRequestParser::ParsedRequest& request);

    /**
     * Parse scheme://[userinfo@]host[:port][/path...] and apply the scheme's
     * default port when none is given
     */
    static Target resolveAbsoluteUrl(std::string_view url);

    /**
     * Split host:port on the first ':' (after the closing ']' for IPv6
     * literals); both halves are required
     */
    static Target resolveConnectTarget(std::string_view authority);

    /**
     * Well-known port of a URL scheme (lowercase)
     * @return port, or -1 if the scheme has no default
     */
    static int defaultPortForScheme(std::string_view scheme);

private:
    static Target failure(ProxyError error, std::string_view offending);
    static bool isValidHostChar(char c);
};

#endif // TARGET_RESOLVER_HPP
