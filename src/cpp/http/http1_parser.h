#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <array>

namespace hellosvc {
namespace http {

/**
 * Zero-allocation HTTP/1.0 and HTTP/1.1 request parser.
 *
 * - No heap allocations (string_views into the caller's buffer)
 * - No callbacks (direct returns)
 * - No exceptions
 *
 * HTTP/1.1: RFC 7230-7235
 */

enum class HTTP1Method : uint8_t {
    GET = 0,
    HEAD = 1,
    POST = 2,
    PUT = 3,
    DELETE = 4,
    CONNECT = 5,
    OPTIONS = 6,
    TRACE = 7,
    PATCH = 8,
    UNKNOWN = 255
};

enum class HTTP1Version : uint8_t {
    HTTP_1_0 = 0,
    HTTP_1_1 = 1,
    UNKNOWN = 255
};

enum class HTTP1State : uint8_t {
    START,
    METHOD,
    URL,
    VERSION,
    HEADER_FIELD,
    HEADER_VALUE,
    BODY,       // Headers complete, waiting for Content-Length bytes
    COMPLETE,
    ERROR
};

/**
 * Parsed HTTP/1.x request.
 *
 * All string_views point into the original buffer (zero-copy).
 */
struct HTTP1Request {
    HTTP1Method method{HTTP1Method::UNKNOWN};
    HTTP1Version version{HTTP1Version::HTTP_1_1};

    std::string_view method_str;
    std::string_view url;
    std::string_view path;      // Extracted from URL
    std::string_view query;     // Extracted from URL
    std::string_view fragment;  // Extracted from URL

    static constexpr size_t MAX_HEADERS = 100;
    struct Header {
        std::string_view name;
        std::string_view value;
    };
    std::array<Header, MAX_HEADERS> headers;
    size_t header_count{0};

    // Request line + headers + blank line
    size_t header_length{0};

    std::string_view body;

    uint64_t content_length{0};
    bool has_content_length{false};

    bool chunked{false};
    bool keep_alive{false};

    /**
     * Get header value by name (case-insensitive).
     */
    std::string_view get_header(std::string_view name) const noexcept;

    bool has_header(std::string_view name) const noexcept;
};

/**
 * HTTP/1.x parser.
 *
 * Each parse() call re-scans the buffer from the start, so the caller simply
 * appends bytes and calls again until the request is complete.
 */
class HTTP1Parser {
public:
    HTTP1Parser();

    /**
     * Parse HTTP request from buffer.
     *
     * @param data Input buffer (must remain valid while the request is used)
     * @param len Buffer length
     * @param out_request Parsed request (views into data buffer)
     * @param out_consumed Bytes belonging to this request (headers + body)
     * @return 0 on success, 1 on error, -1 if need more data
     *
     * When -1 is returned with get_state() == BODY, the headers are complete
     * and out_request.content_length is valid.
     */
    int parse(
        const uint8_t* data,
        size_t len,
        HTTP1Request& out_request,
        size_t& out_consumed
    ) noexcept;

    void reset() noexcept;

    HTTP1State get_state() const noexcept { return state_; }
    bool is_complete() const noexcept { return state_ == HTTP1State::COMPLETE; }
    bool has_error() const noexcept { return state_ == HTTP1State::ERROR; }

    static HTTP1Method method_from_string(std::string_view method) noexcept;

    /**
     * Case-insensitive string compare (also used by HTTP1Request::get_header).
     */
    static bool str_eq_ci(std::string_view a, std::string_view b) noexcept;

private:
    HTTP1State state_;
    size_t pos_;   // Current position in buffer
    size_t mark_;  // Start of current token

    int parse_method(const uint8_t* data, size_t len, HTTP1Request& req) noexcept;
    int parse_url(const uint8_t* data, size_t len, HTTP1Request& req) noexcept;
    int parse_version(const uint8_t* data, size_t len, HTTP1Request& req) noexcept;
    int parse_header_field(const uint8_t* data, size_t len, HTTP1Request& req) noexcept;
    int parse_header_value(const uint8_t* data, size_t len, HTTP1Request& req) noexcept;

    /**
     * Interpret Content-Length, Transfer-Encoding and Connection.
     * @return 0 on success, 1 on malformed values
     */
    int apply_framing_headers(HTTP1Request& req) noexcept;

    void parse_url_components(HTTP1Request& req) noexcept;

    static bool is_token_char(uint8_t c) noexcept;
    static bool is_whitespace(uint8_t c) noexcept;
};

} // namespace http
} // namespace hellosvc
