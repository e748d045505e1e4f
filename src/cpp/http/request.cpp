#include "request.h"

namespace hellosvc {
namespace http {

Request::Request(std::string method, std::string target,
                 std::vector<Header> headers, std::string body,
                 std::string client_ip)
    : method_(HTTP1Parser::method_from_string(method))
    , method_str_(std::move(method))
    , target_(std::move(target))
    , headers_(std::move(headers))
    , body_(std::move(body))
    , client_ip_(std::move(client_ip))
{
    split_target();
}

Request Request::from_parsed(const HTTP1Request& parsed, const std::string& client_ip) {
    Request req;
    req.method_ = parsed.method;
    req.version_ = parsed.version;
    req.method_str_ = std::string(parsed.method_str);
    req.target_ = std::string(parsed.url);
    req.path_ = std::string(parsed.path);
    req.query_ = std::string(parsed.query);

    req.headers_.reserve(parsed.header_count);
    for (size_t i = 0; i < parsed.header_count; ++i) {
        const auto& header = parsed.headers[i];
        req.headers_.emplace_back(std::string(header.name), std::string(header.value));
    }

    req.body_ = std::string(parsed.body);
    req.client_ip_ = client_ip;
    return req;
}

std::string_view Request::get_header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            return value;
        }
    }
    return {};
}

bool Request::has_header(std::string_view name) const noexcept {
    for (const auto& header : headers_) {
        if (HTTP1Parser::str_eq_ci(header.first, name)) {
            return true;
        }
    }
    return false;
}

bool Request::is_json() const noexcept {
    auto content_type = get_content_type();
    if (content_type.empty()) {
        return false;
    }

    // Media type without parameters, case-insensitive
    auto semi = content_type.find(';');
    auto media = content_type.substr(0, semi);
    while (!media.empty() && (media.back() == ' ' || media.back() == '\t')) {
        media.remove_suffix(1);
    }

    if (HTTP1Parser::str_eq_ci(media, "application/json")) {
        return true;
    }
    return media.size() > 5 &&
           HTTP1Parser::str_eq_ci(media.substr(media.size() - 5), "+json");
}

void Request::split_target() {
    auto fragment = target_.find('#');
    std::string_view without_fragment(target_.data(),
                                      fragment == std::string::npos ? target_.size() : fragment);

    auto query_pos = without_fragment.find('?');
    if (query_pos == std::string_view::npos) {
        path_ = std::string(without_fragment);
        query_.clear();
    } else {
        path_ = std::string(without_fragment.substr(0, query_pos));
        query_ = std::string(without_fragment.substr(query_pos + 1));
    }
}

} // namespace http
} // namespace hellosvc
