#ifndef HTTP_REQUEST_PARSER_HPP
#define HTTP_REQUEST_PARSER_HPP

#include "ProxyError.hpp"

#include <cstddef>
#include <string>
#include <string_view>

/**
 * Request methods the proxy recognises on the request line
 */
enum class HttpMethod {
    Get,
    Post,
    Put,
    Delete,
    Head,
    Options,
    Connect,
    Unknown
};

/**
 * HTTPRequestParser - Reads and parses the request line of a new client connection
 *
 * Responsibilities:
 * - Read the initial bytes of a freshly accepted connection (bounded)
 * - Extract method and target from the first line
 * - Keep the raw bytes so they can be forwarded verbatim in HTTP mode
 *
 * Nothing past the first line is interpreted.
 */
class HTTPRequestParser {
public:
    /** Upper bound on the bytes inspected for the request line */
    static constexpr size_t kMaxInitialRead = 4096;

    /** Upper bound on a CONNECT request's header block */
    static constexpr size_t kMaxHeaderBlock = 16384;

    /**
     * Result of parsing the first line
     */
    struct ParsedRequest {
        HttpMethod method = HttpMethod::Unknown;
        std::string method_token;   // Method exactly as sent
        std::string target;         // Raw request target
        std::string raw;            // Every byte read so far, verbatim
        ProxyError error = ProxyError::None;

        bool valid() const { return error == ProxyError::None; }
    };

    /**
     * Read the initial request bytes from a client socket
     *
     * Keeps reading until a CRLF has arrived, kMaxInitialRead bytes are
     * buffered, or the peer closes. Does not read past the cap.
     *
     * @param client_fd Client socket file descriptor
     * @param buffer Output: bytes read (possibly empty if the peer closed at once)
     * @return false on a socket error or receive timeout, true otherwise
     */
    static bool readInitialRequest(int client_fd, std::string& buffer);

    /**
     * Take whatever CONNECT header bytes the client has already sent
     *
     * Never waits: only bytes queued on the socket right now are consumed,
     * stopping at the blank line, kMaxHeaderBlock bytes, or an empty queue.
     * An incomplete block is left as is; the tunnel proceeds regardless.
     *
     * @param client_fd Client socket file descriptor
     * @param buffer Appended to in place
     */
    static void drainHeaderBlock(int client_fd, std::string& buffer);

    /**
     * Offset just past the blank line ending the header block
     * @return offset, or std::string_view::npos if the block is incomplete
     */
    static size_t headerBlockEnd(std::string_view buffer);

    /**
     * Parse the request line out of the initial bytes
     *
     * Pure function over an immutable view; the same input always produces
     * the same result.
     *
     * @param buffer Initial bytes from the client
     * @return ParsedRequest, with error set to the failure kind on failure
     */
    static ParsedRequest parse(std::string_view buffer);

    /**
     * Classify a method token (case-sensitive)
     */
    static HttpMethod classifyMethod(std::string_view token);

    /**
     * Canonical name of a method ("UNKNOWN" for HttpMethod::Unknown)
     */
    static const char* methodName(HttpMethod method);

    /**
     * First line of a buffer without its terminator (whole buffer if there is none)
     */
    static std::string_view firstLine(std::string_view buffer);
};

#endif // HTTP_REQUEST_PARSER_HPP
