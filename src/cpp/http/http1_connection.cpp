/**
 * HTTP/1.1 Connection Implementation
 *
 * Request/response lifecycle management with keep-alive and pipelining
 */

#include "http1_connection.h"
#include "../core/logger.h"

namespace hellosvc {
namespace http {

using core::result;
using core::ok;
using core::err;
using core::error_code;

Http1Connection::Http1Connection(std::string client_ip, size_t max_body_bytes)
    : client_ip_(std::move(client_ip))
    , max_body_bytes_(max_body_bytes)
{
    input_buffer_.reserve(8192);   // 8KB initial buffer
    output_buffer_.reserve(8192);
}

result<size_t> Http1Connection::process_input(const uint8_t* data, size_t len) {
    if (state_ == Http1State::ERROR || state_ == Http1State::CLOSING) {
        return err<size_t>(error_code::invalid_state);
    }

    if (input_buffer_.empty() && len > 0) {
        request_started_ = std::chrono::steady_clock::now();
    }
    input_buffer_.insert(input_buffer_.end(), data, data + len);
    drain_requests();

    return ok(len);
}

void Http1Connection::drain_requests() {
    while (state_ != Http1State::CLOSING && state_ != Http1State::ERROR &&
           !input_buffer_.empty()) {
        HTTP1Request parsed;
        size_t consumed = 0;
        int parse_result = parser_.parse(
            input_buffer_.data(),
            input_buffer_.size(),
            parsed,
            consumed
        );

        if (parse_result < 0) {
            // Need more data; enforce limits on what is already buffered
            if (parser_.get_state() == HTTP1State::BODY) {
                if (parsed.chunked) {
                    reject(Response::Status::NOT_IMPLEMENTED, parsed.path,
                           "chunked transfer encoding not supported");
                } else if (parsed.content_length > max_body_bytes_) {
                    reject(Response::Status::PAYLOAD_TOO_LARGE, parsed.path,
                           "declared body exceeds limit");
                }
            } else if (input_buffer_.size() > MAX_HEADER_BYTES) {
                reject(Response::Status::REQUEST_HEADER_FIELDS_TOO_LARGE, "",
                       "header block too large");
            }
            return;
        }

        if (parse_result > 0) {
            reject(Response::Status::BAD_REQUEST, parsed.url, "HTTP parse error");
            return;
        }

        if (parsed.chunked) {
            reject(Response::Status::NOT_IMPLEMENTED, parsed.path,
                   "chunked transfer encoding not supported");
            return;
        }

        if (parsed.content_length > max_body_bytes_) {
            reject(Response::Status::PAYLOAD_TOO_LARGE, parsed.path,
                   "declared body exceeds limit");
            return;
        }

        if (!request_callback_) {
            error_message_ = "No request callback set";
            state_ = Http1State::ERROR;
            return;
        }

        // Copy out before the buffer shifts
        Request request = Request::from_parsed(parsed, client_ip_);
        bool keep_alive = parsed.keep_alive;
        input_buffer_.erase(input_buffer_.begin(),
                            input_buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
        // A pipelined request behind this one starts its clock now
        request_started_ = std::chrono::steady_clock::now();

        LOG_DEBUG("HTTP1", "%s %s from %s (keep-alive: %d)",
                  request.get_method_str().c_str(), request.get_target().c_str(),
                  client_ip_.c_str(), keep_alive);

        Response response = request_callback_(request);
        queue_response(response, keep_alive, request.get_method() != HTTP1Method::HEAD);
        requests_served_++;

        state_ = keep_alive ? Http1State::WRITING_RESPONSE : Http1State::CLOSING;
    }
}

void Http1Connection::reject(Response::Status status, std::string_view path, const char* reason) {
    LOG_WARN("HTTP1", "Rejecting request from %s: %u %s (%s)", client_ip_.c_str(),
             static_cast<unsigned>(status), status_reason(status), reason);

    error_message_ = reason;
    // path may view input_buffer_
    queue_response(Response::error(status, path), false, true);
    input_buffer_.clear();
    state_ = Http1State::CLOSING;
}

void Http1Connection::queue_timeout_response() {
    if (state_ == Http1State::CLOSING || state_ == Http1State::ERROR) {
        return;
    }
    reject(Response::Status::REQUEST_TIMEOUT, "", "request not completed in time");
}

void Http1Connection::close_after_flush() noexcept {
    if (state_ != Http1State::ERROR) {
        state_ = Http1State::CLOSING;
    }
}

void Http1Connection::queue_response(const Response& response, bool keep_alive, bool include_body) {
    std::string wire = response.to_http_wire_format(keep_alive, include_body,
                                                    std::chrono::system_clock::now());
    output_buffer_.insert(output_buffer_.end(), wire.begin(), wire.end());
}

bool Http1Connection::get_output(const uint8_t** out_data, size_t* out_len) const noexcept {
    if (output_offset_ >= output_buffer_.size()) {
        return false;
    }

    *out_data = output_buffer_.data() + output_offset_;
    *out_len = output_buffer_.size() - output_offset_;
    return true;
}

void Http1Connection::commit_output(size_t len) noexcept {
    output_offset_ += len;

    // All sent: reuse the buffer
    if (output_offset_ >= output_buffer_.size()) {
        output_buffer_.clear();
        output_offset_ = 0;

        if (state_ == Http1State::WRITING_RESPONSE) {
            state_ = Http1State::READING_REQUEST;
        }
    }
}

} // namespace http
} // namespace hellosvc
