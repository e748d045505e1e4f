#include "http1_parser.h"
#include <cctype>
#include <charconv>
#include <cstring>

namespace hellosvc {
namespace http {

// ============================================================================
// HTTP1Request Implementation
// ============================================================================

std::string_view HTTP1Request::get_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1Parser::str_eq_ci(headers[i].name, name)) {
            return headers[i].value;
        }
    }
    return {};
}

bool HTTP1Request::has_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1Parser::str_eq_ci(headers[i].name, name)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// HTTP1Parser Implementation
// ============================================================================

HTTP1Parser::HTTP1Parser()
    : state_(HTTP1State::START), pos_(0), mark_(0) {
}

void HTTP1Parser::reset() noexcept {
    state_ = HTTP1State::START;
    pos_ = 0;
    mark_ = 0;
}

HTTP1Method HTTP1Parser::method_from_string(std::string_view method) noexcept {
    if (method == "GET") return HTTP1Method::GET;
    if (method == "POST") return HTTP1Method::POST;
    if (method == "PUT") return HTTP1Method::PUT;
    if (method == "DELETE") return HTTP1Method::DELETE;
    if (method == "HEAD") return HTTP1Method::HEAD;
    if (method == "OPTIONS") return HTTP1Method::OPTIONS;
    if (method == "PATCH") return HTTP1Method::PATCH;
    if (method == "CONNECT") return HTTP1Method::CONNECT;
    if (method == "TRACE") return HTTP1Method::TRACE;
    return HTTP1Method::UNKNOWN;
}

int HTTP1Parser::parse(
    const uint8_t* data,
    size_t len,
    HTTP1Request& out_request,
    size_t& out_consumed
) noexcept {
    if (!data || len == 0) {
        return -1;  // Need more data
    }

    out_request = HTTP1Request{};
    state_ = HTTP1State::METHOD;
    pos_ = 0;
    mark_ = 0;

    // Request line: METHOD SP URL SP VERSION CRLF
    if (parse_method(data, len, out_request) != 0) {
        return state_ == HTTP1State::ERROR ? 1 : -1;
    }

    if (parse_url(data, len, out_request) != 0) {
        return state_ == HTTP1State::ERROR ? 1 : -1;
    }

    if (parse_version(data, len, out_request) != 0) {
        return state_ == HTTP1State::ERROR ? 1 : -1;
    }

    // Headers, terminated by an empty line
    while (state_ != HTTP1State::BODY) {
        if (pos_ + 1 >= len) {
            return -1;
        }

        if (data[pos_] == '\r' && data[pos_ + 1] == '\n') {
            pos_ += 2;
            state_ = HTTP1State::BODY;
            break;
        }

        if (parse_header_field(data, len, out_request) != 0) {
            return state_ == HTTP1State::ERROR ? 1 : -1;
        }

        if (parse_header_value(data, len, out_request) != 0) {
            return state_ == HTTP1State::ERROR ? 1 : -1;
        }
    }

    out_request.header_length = pos_;
    parse_url_components(out_request);

    if (apply_framing_headers(out_request) != 0) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    if (out_request.has_content_length && out_request.content_length > 0) {
        size_t body_available = len - pos_;

        if (body_available < out_request.content_length) {
            return -1;  // Need more data (state_ stays BODY)
        }

        out_request.body = std::string_view(
            reinterpret_cast<const char*>(data + pos_),
            static_cast<size_t>(out_request.content_length)
        );
        pos_ += static_cast<size_t>(out_request.content_length);
    }

    state_ = HTTP1State::COMPLETE;
    out_consumed = pos_;
    return 0;
}

int HTTP1Parser::parse_method(
    const uint8_t* data,
    size_t len,
    HTTP1Request& req
) noexcept {
    mark_ = pos_;

    while (pos_ < len && data[pos_] != ' ') {
        if (!is_token_char(data[pos_])) {
            state_ = HTTP1State::ERROR;
            return 1;
        }
        pos_++;
    }

    if (pos_ >= len) {
        return -1;
    }

    if (pos_ == mark_) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    req.method_str = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        pos_ - mark_
    );
    req.method = method_from_string(req.method_str);

    pos_++;  // Skip space
    state_ = HTTP1State::URL;

    return 0;
}

int HTTP1Parser::parse_url(
    const uint8_t* data,
    size_t len,
    HTTP1Request& req
) noexcept {
    mark_ = pos_;

    while (pos_ < len && data[pos_] != ' ') {
        if (data[pos_] == '\r' || data[pos_] == '\n') {
            state_ = HTTP1State::ERROR;
            return 1;
        }
        pos_++;
    }

    if (pos_ >= len) {
        return -1;
    }

    if (pos_ == mark_) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    req.url = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        pos_ - mark_
    );

    pos_++;  // Skip space
    state_ = HTTP1State::VERSION;

    return 0;
}

int HTTP1Parser::parse_version(
    const uint8_t* data,
    size_t len,
    HTTP1Request& req
) noexcept {
    // Expect "HTTP/1.0" or "HTTP/1.1" followed by CRLF
    size_t available = len - pos_;
    size_t cmp_len = available < 10 ? available : 10;

    const char* v11 = "HTTP/1.1\r\n";
    const char* v10 = "HTTP/1.0\r\n";

    bool maybe_11 = std::memcmp(data + pos_, v11, cmp_len) == 0;
    bool maybe_10 = std::memcmp(data + pos_, v10, cmp_len) == 0;

    if (!maybe_11 && !maybe_10) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    if (available < 10) {
        return -1;
    }

    req.version = maybe_11 ? HTTP1Version::HTTP_1_1 : HTTP1Version::HTTP_1_0;
    pos_ += 10;

    state_ = HTTP1State::HEADER_FIELD;
    return 0;
}

int HTTP1Parser::parse_header_field(
    const uint8_t* data,
    size_t len,
    HTTP1Request& req
) noexcept {
    if (req.header_count >= HTTP1Request::MAX_HEADERS) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    mark_ = pos_;

    while (pos_ < len && data[pos_] != ':') {
        if (!is_token_char(data[pos_])) {
            state_ = HTTP1State::ERROR;
            return 1;
        }
        pos_++;
    }

    if (pos_ >= len) {
        return -1;
    }

    if (pos_ == mark_) {
        state_ = HTTP1State::ERROR;
        return 1;
    }

    auto& header = req.headers[req.header_count];
    header.name = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        pos_ - mark_
    );

    pos_++;  // Skip colon

    while (pos_ < len && (data[pos_] == ' ' || data[pos_] == '\t')) {
        pos_++;
    }

    state_ = HTTP1State::HEADER_VALUE;
    return 0;
}

int HTTP1Parser::parse_header_value(
    const uint8_t* data,
    size_t len,
    HTTP1Request& req
) noexcept {
    mark_ = pos_;

    while (pos_ + 1 < len && !(data[pos_] == '\r' && data[pos_ + 1] == '\n')) {
        pos_++;
    }

    if (pos_ + 1 >= len) {
        return -1;
    }

    // Trim trailing whitespace
    size_t value_end = pos_;
    while (value_end > mark_ && is_whitespace(data[value_end - 1])) {
        value_end--;
    }

    auto& header = req.headers[req.header_count];
    header.value = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        value_end - mark_
    );

    req.header_count++;
    pos_ += 2;  // Skip CRLF

    state_ = HTTP1State::HEADER_FIELD;
    return 0;
}

int HTTP1Parser::apply_framing_headers(HTTP1Request& req) noexcept {
    if (req.has_header("content-length")) {
        auto content_len = req.get_header("content-length");
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(content_len.data(),
                                         content_len.data() + content_len.size(), value);
        if (content_len.empty() || ec != std::errc() ||
            ptr != content_len.data() + content_len.size()) {
            return 1;
        }
        req.content_length = value;
        req.has_content_length = true;
    }

    auto transfer_enc = req.get_header("transfer-encoding");
    if (!transfer_enc.empty() && transfer_enc.find("chunked") != std::string_view::npos) {
        req.chunked = true;
    }

    auto connection = req.get_header("connection");
    if (req.version == HTTP1Version::HTTP_1_1) {
        req.keep_alive = !str_eq_ci(connection, "close");
    } else {
        req.keep_alive = str_eq_ci(connection, "keep-alive");
    }

    return 0;
}

void HTTP1Parser::parse_url_components(HTTP1Request& req) noexcept {
    const char* url_data = req.url.data();
    size_t url_len = req.url.length();

    size_t query_pos = req.url.find('?');
    if (query_pos != std::string_view::npos) {
        req.path = std::string_view(url_data, query_pos);

        size_t fragment_pos = req.url.find('#', query_pos);
        if (fragment_pos != std::string_view::npos) {
            req.query = std::string_view(url_data + query_pos + 1, fragment_pos - query_pos - 1);
            req.fragment = std::string_view(url_data + fragment_pos + 1, url_len - fragment_pos - 1);
        } else {
            req.query = std::string_view(url_data + query_pos + 1, url_len - query_pos - 1);
        }
    } else {
        size_t fragment_pos = req.url.find('#');
        if (fragment_pos != std::string_view::npos) {
            req.path = std::string_view(url_data, fragment_pos);
            req.fragment = std::string_view(url_data + fragment_pos + 1, url_len - fragment_pos - 1);
        } else {
            req.path = req.url;
        }
    }
}

bool HTTP1Parser::is_token_char(uint8_t c) noexcept {
    // RFC 7230: token characters
    return std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '%' ||
           c == '&' || c == '\'' || c == '*' || c == '+' || c == '-' ||
           c == '.' || c == '^' || c == '_' || c == '`' || c == '|' || c == '~';
}

bool HTTP1Parser::is_whitespace(uint8_t c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool HTTP1Parser::str_eq_ci(std::string_view a, std::string_view b) noexcept {
    if (a.length() != b.length()) {
        return false;
    }

    for (size_t i = 0; i < a.length(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace http
} // namespace hellosvc
