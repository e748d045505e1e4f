#pragma once

#include "http1_connection.h"
#include "request.h"
#include "response.h"
#include "../core/result.h"
#include "../net/tcp_listener.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace hellosvc {
namespace http {

/**
 * HTTP/1.1 server on a single epoll event loop.
 *
 * Owns the listener and the connection table. Every connection is driven
 * by an Http1Connection; complete requests go to the request handler and
 * responses are written back in request order.
 */
class HttpServer {
public:
    // Server configuration
    struct Config {
        std::string host = "localhost";
        uint16_t port = 3000;
        size_t max_body_bytes = 10 * 1024 * 1024;
        uint32_t request_timeout_ms = 30000;    // 0 = no timeout
        int tick_ms = 100;                      // Timeout sweep interval
    };

    using RequestHandler = std::function<Response(const Request&)>;

    /**
     * Called on every loop tick; return true to stop serving.
     */
    using StopPredicate = std::function<bool()>;

    HttpServer(const Config& config, RequestHandler handler);
    ~HttpServer();

    // Non-copyable, non-movable (the listener callbacks capture this)
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * Bind the listening socket.
     *
     * @return ok, or address_in_use / permission_denied / bind_failed
     */
    core::result<void> bind();

    /**
     * Serve until stop() or until should_stop returns true.
     *
     * @return 0 on clean stop, -1 if not bound or the event loop failed
     */
    int run(const StopPredicate& should_stop = {});

    /**
     * Stop the server. Thread-safe.
     */
    void stop();

    bool is_running() const;

    uint16_t bound_port() const { return listener_.bound_port(); }

    int last_errno() const { return listener_.last_errno(); }

    const Config& config() const { return config_; }

    /**
     * Server statistics (loop thread only).
     */
    struct Stats {
        uint64_t total_connections{0};
        uint64_t active_connections{0};
        uint64_t total_requests{0};
        uint64_t timed_out_connections{0};
        uint64_t bytes_received{0};
        uint64_t bytes_sent{0};
    };

    Stats get_stats() const noexcept;

private:
    struct ClientConnection {
        net::TcpSocket socket;
        Http1Connection http;
        std::chrono::steady_clock::time_point last_activity;
        bool write_armed = false;

        ClientConnection(net::TcpSocket s, std::string client_ip, size_t max_body)
            : socket(std::move(s)), http(std::move(client_ip), max_body),
              last_activity(std::chrono::steady_clock::now()) {}
    };

    void on_connection(net::TcpSocket socket, const struct sockaddr_in& peer,
                       net::EventLoop* event_loop);

    void on_client_event(int fd, net::IOEvent events);

    /**
     * Read until EAGAIN.
     * @return false if the connection must be closed now
     */
    bool read_available(ClientConnection& conn);

    /**
     * Write pending output until done or EAGAIN; arms/disarms WRITE interest.
     * @return false if the connection must be closed now
     */
    bool flush(ClientConnection& conn);

    void close_connection(int fd);

    void sweep_idle_connections();

    Config config_;
    RequestHandler handler_;
    net::TcpListener listener_;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> connections_;

    uint64_t total_connections_{0};
    uint64_t timed_out_connections_{0};
    uint64_t bytes_received_{0};
    uint64_t bytes_sent_{0};
    uint64_t requests_on_closed_{0};
};

} // namespace http
} // namespace hellosvc
