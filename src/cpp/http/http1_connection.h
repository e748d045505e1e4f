/**
 * HTTP/1.1 Connection Handler
 *
 * Manages one HTTP/1.0 or HTTP/1.1 connection, independent of the socket:
 * - Request framing (HTTP1Parser, Content-Length bodies)
 * - Keep-alive and pipelining (responses queued in request order)
 * - Protocol-level error responses (400, 408, 413, 431, 501) followed by close
 *
 * Usage:
 *   Http1Connection conn("127.0.0.1", max_body);
 *   conn.set_request_callback(handler);
 *
 *   // In event loop:
 *   conn.process_input(data, len);  // Parse requests, queue responses
 *   conn.get_output(&p, &n);        // Send pending bytes
 *   conn.commit_output(sent);
 */

#pragma once

#include "http1_parser.h"
#include "request.h"
#include "response.h"
#include "../core/result.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace hellosvc {
namespace http {

/**
 * HTTP/1.1 Connection State
 */
enum class Http1State {
    READING_REQUEST,     // Waiting for (more of) a request
    WRITING_RESPONSE,    // Output queued, connection stays open afterwards
    CLOSING,             // Flush remaining output, then close
    ERROR                // Unusable, close immediately
};

class Http1Connection {
public:
    /**
     * Request callback type
     *
     * Called once per complete request, in arrival order.
     */
    using RequestCallback = std::function<Response(const Request&)>;

    /**
     * Longest accepted request line + header block.
     */
    static constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

    /**
     * @param client_ip Peer address recorded in each Request
     * @param max_body_bytes Larger declared bodies are answered with 413
     */
    Http1Connection(std::string client_ip, size_t max_body_bytes);

    // Non-copyable, movable
    Http1Connection(const Http1Connection&) = delete;
    Http1Connection& operator=(const Http1Connection&) = delete;
    Http1Connection(Http1Connection&&) = default;
    Http1Connection& operator=(Http1Connection&&) = default;

    void set_request_callback(RequestCallback callback) {
        request_callback_ = std::move(callback);
    }

    /**
     * Process incoming data
     *
     * Appends to the input buffer, then answers every complete request it
     * holds. Protocol errors are answered on the wire and move the
     * connection to CLOSING; they are not reported as errors here.
     *
     * @return Bytes accepted, or invalid_state if the connection is closing
     */
    core::result<size_t> process_input(const uint8_t* data, size_t len);

    /**
     * Get output data to send
     *
     * @return true if data available, false if none
     */
    bool get_output(const uint8_t** out_data, size_t* out_len) const noexcept;

    /**
     * Commit sent output
     *
     * Call after sending data returned by get_output().
     *
     * @param len Number of bytes sent
     */
    void commit_output(size_t len) noexcept;

    /**
     * Queue a 408 and close once it is flushed (idle timeout).
     */
    void queue_timeout_response();

    /**
     * Peer finished sending: stop reading, close once output is flushed.
     */
    void close_after_flush() noexcept;

    Http1State get_state() const noexcept { return state_; }

    bool should_close() const noexcept {
        return (state_ == Http1State::CLOSING && !has_pending_output()) ||
               state_ == Http1State::ERROR;
    }

    bool has_pending_output() const noexcept {
        return output_offset_ < output_buffer_.size();
    }

    /**
     * True while bytes of an unfinished request are buffered.
     */
    bool has_partial_request() const noexcept { return !input_buffer_.empty(); }

    /**
     * When the first byte of the buffered partial request arrived. Only
     * meaningful while has_partial_request() is true; later bytes of the same
     * request do not move it.
     */
    std::chrono::steady_clock::time_point request_started() const noexcept {
        return request_started_;
    }

    size_t requests_served() const noexcept { return requests_served_; }

    const std::string& get_error() const noexcept { return error_message_; }

private:
    /**
     * Answer complete requests at the front of the input buffer.
     */
    void drain_requests();

    /**
     * Queue a protocol error response and stop reading.
     */
    void reject(Response::Status status, std::string_view path, const char* reason);

    void queue_response(const Response& response, bool keep_alive, bool include_body);

    std::string client_ip_;
    size_t max_body_bytes_;
    Http1State state_ = Http1State::READING_REQUEST;

    HTTP1Parser parser_;
    std::vector<uint8_t> input_buffer_;
    std::chrono::steady_clock::time_point request_started_;

    std::vector<uint8_t> output_buffer_;
    size_t output_offset_ = 0;

    size_t requests_served_ = 0;

    RequestCallback request_callback_;

    std::string error_message_;
};

} // namespace http
} // namespace hellosvc
