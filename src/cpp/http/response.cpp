#include "response.h"
#include "http1_parser.h"
#include "json_writer.h"

namespace hellosvc {
namespace http {

const char* status_reason(uint16_t code) noexcept {
    switch (code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

Response Response::error(Status status, std::string_view path) {
    Response res;
    res.status(status);
    res.json(error_body(status_reason(status), static_cast<int>(status), path));
    return res;
}

Response& Response::status(Status status) noexcept {
    status_ = status;
    return *this;
}

Response& Response::header(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            existing = value;
            return *this;
        }
    }
    headers_.emplace_back(name, value);
    return *this;
}

Response& Response::content_type(const std::string& content_type) {
    return header("Content-Type", content_type);
}

Response& Response::text(std::string text) {
    body_ = std::move(text);
    return content_type("text/plain; charset=utf-8");
}

Response& Response::json(std::string data) {
    body_ = std::move(data);
    return content_type("application/json");
}

std::string_view Response::get_header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            return value;
        }
    }
    return {};
}

std::string Response::to_http_wire_format(bool keep_alive, bool include_body,
                                          core::SystemTime now) const {
    std::string response;
    response.reserve(256 + body_.size());

    // Status line: "HTTP/1.1 200 OK\r\n"
    response += "HTTP/1.1 ";
    response += std::to_string(get_status_code());
    response += ' ';
    response += status_reason(get_status_code());
    response += "\r\n";

    // Handler headers (framing headers are ours)
    for (const auto& [name, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(name, "content-length") ||
            HTTP1Parser::str_eq_ci(name, "connection") ||
            HTTP1Parser::str_eq_ci(name, "date") ||
            HTTP1Parser::str_eq_ci(name, "server")) {
            continue;
        }
        response += name;
        response += ": ";
        response += value;
        response += "\r\n";
    }

    response += "Content-Length: ";
    response += std::to_string(body_.size());
    response += "\r\n";

    response += "Connection: ";
    response += keep_alive ? "keep-alive" : "close";
    response += "\r\n";

    response += "Date: ";
    response += core::format_http_date(now);
    response += "\r\n";

    response += "Server: ";
    response += SERVER_NAME;
    response += "\r\n";

    // End of headers
    response += "\r\n";

    if (include_body) {
        response += body_;
    }

    return response;
}

} // namespace http
} // namespace hellosvc
