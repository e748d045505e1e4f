#pragma once

#include "../core/time_format.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hellosvc {
namespace http {

/**
 * HTTP response built by the pipeline.
 *
 * Content-Length, Connection, Date and Server are added at serialization
 * time and cannot be overridden by handlers.
 */
class Response {
public:
    // HTTP status codes
    enum class Status : uint16_t {
        OK = 200,
        NO_CONTENT = 204,
        BAD_REQUEST = 400,
        NOT_FOUND = 404,
        METHOD_NOT_ALLOWED = 405,
        REQUEST_TIMEOUT = 408,
        PAYLOAD_TOO_LARGE = 413,
        REQUEST_HEADER_FIELDS_TOO_LARGE = 431,
        INTERNAL_SERVER_ERROR = 500,
        NOT_IMPLEMENTED = 501,
        SERVICE_UNAVAILABLE = 503
    };

    using Header = std::pair<std::string, std::string>;

    static constexpr const char* SERVER_NAME = "hellosvc";

    Response() = default;

    // Non-copyable, movable
    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;
    Response(Response&&) noexcept = default;
    Response& operator=(Response&&) noexcept = default;

    /**
     * JSON error body for status, using its reason phrase as the "error"
     * field: {"error":"Not Found","status":404,"timestamp":...,"path":...}
     */
    static Response error(Status status, std::string_view path);

    Response& status(Status status) noexcept;

    /**
     * Set response header (replaces an existing header of the same name,
     * compared case-insensitively).
     */
    Response& header(const std::string& name, const std::string& value);

    Response& content_type(const std::string& content_type);

    /**
     * Set body with Content-Type: text/plain; charset=utf-8
     */
    Response& text(std::string text);

    /**
     * Set body with Content-Type: application/json
     */
    Response& json(std::string data);

    Status get_status() const noexcept { return status_; }
    uint16_t get_status_code() const noexcept { return static_cast<uint16_t>(status_); }

    /**
     * @return Header value, or empty if not set
     */
    std::string_view get_header(std::string_view name) const noexcept;

    const std::vector<Header>& get_headers() const noexcept { return headers_; }

    const std::string& get_body() const noexcept { return body_; }

    /**
     * Serialize status line, headers and body.
     *
     * @param keep_alive Value of the Connection header
     * @param include_body false for HEAD (Content-Length still describes the body)
     * @param now Value of the Date header
     */
    std::string to_http_wire_format(bool keep_alive, bool include_body,
                                    core::SystemTime now) const;

    std::string to_http_wire_format(bool keep_alive) const {
        return to_http_wire_format(keep_alive, true, std::chrono::system_clock::now());
    }

private:
    Status status_ = Status::OK;
    std::vector<Header> headers_;
    std::string body_;
};

/**
 * Reason phrase for a status code ("Not Found"), "Unknown" if unlisted.
 */
const char* status_reason(uint16_t code) noexcept;

inline const char* status_reason(Response::Status status) noexcept {
    return status_reason(static_cast<uint16_t>(status));
}

} // namespace http
} // namespace hellosvc
