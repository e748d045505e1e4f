#pragma once

#include "http1_parser.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hellosvc {
namespace http {

/**
 * HTTP request value handed to the pipeline.
 *
 * Owns copies of everything the parser found, so it outlives the
 * connection's input buffer.
 */
class Request {
public:
    using Header = std::pair<std::string, std::string>;

    Request() = default;

    /**
     * Build a request directly (tests, benchmarks).
     *
     * @param method Method token, e.g. "GET"
     * @param target Request target as received, e.g. "/hello?x=1"
     */
    Request(std::string method, std::string target,
            std::vector<Header> headers = {}, std::string body = {},
            std::string client_ip = "127.0.0.1");

    /**
     * Copy a parsed HTTP/1.x request out of the connection buffer.
     */
    static Request from_parsed(const HTTP1Request& parsed, const std::string& client_ip);

    HTTP1Method get_method() const noexcept { return method_; }

    /**
     * Method token exactly as sent by the client.
     */
    const std::string& get_method_str() const noexcept { return method_str_; }

    /**
     * Path plus query string, as received.
     */
    const std::string& get_target() const noexcept { return target_; }

    /**
     * Path component only (no query, no fragment).
     */
    const std::string& get_path() const noexcept { return path_; }

    const std::string& get_query() const noexcept { return query_; }

    HTTP1Version get_version() const noexcept { return version_; }

    /**
     * Get header value.
     *
     * @param name Header name (case-insensitive)
     * @return Header value, or empty if not present
     */
    std::string_view get_header(std::string_view name) const noexcept;

    bool has_header(std::string_view name) const noexcept;

    /**
     * All headers in arrival order.
     */
    const std::vector<Header>& get_headers() const noexcept { return headers_; }

    const std::string& get_body() const noexcept { return body_; }

    std::string_view get_content_type() const noexcept { return get_header("content-type"); }

    std::string_view get_user_agent() const noexcept { return get_header("user-agent"); }

    /**
     * True for application/json and any +json media type.
     */
    bool is_json() const noexcept;

    const std::string& get_client_ip() const noexcept { return client_ip_; }

private:
    void split_target();

    HTTP1Method method_{HTTP1Method::UNKNOWN};
    HTTP1Version version_{HTTP1Version::HTTP_1_1};
    std::string method_str_;
    std::string target_;
    std::string path_;
    std::string query_;
    std::vector<Header> headers_;
    std::string body_;
    std::string client_ip_;
};

} // namespace http
} // namespace hellosvc
