#include "server.h"
#include "../core/logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace hellosvc {
namespace http {

namespace {

net::TcpListenerConfig listener_config(const HttpServer::Config& config) {
    net::TcpListenerConfig lc;
    lc.host = config.host;
    lc.port = config.port;
    lc.tick_ms = config.tick_ms;
    return lc;
}

} // namespace

HttpServer::HttpServer(const Config& config, RequestHandler handler)
    : config_(config)
    , handler_(std::move(handler))
    , listener_(listener_config(config_),
                [this](net::TcpSocket socket, const struct sockaddr_in& peer,
                       net::EventLoop* event_loop) {
                    on_connection(std::move(socket), peer, event_loop);
                })
{
}

HttpServer::~HttpServer() {
    if (auto* loop = listener_.event_loop()) {
        for (const auto& entry : connections_) {
            loop->remove_fd(entry.first);
        }
    }
    connections_.clear();
}

core::result<void> HttpServer::bind() {
    return listener_.bind();
}

int HttpServer::run(const StopPredicate& should_stop) {
    int result = listener_.run([this, &should_stop]() {
        if (should_stop && should_stop()) {
            listener_.stop();
            return;
        }
        sweep_idle_connections();
    });

    // Shutdown: drop every open connection
    std::vector<int> open;
    open.reserve(connections_.size());
    for (const auto& entry : connections_) {
        open.push_back(entry.first);
    }
    for (int fd : open) {
        close_connection(fd);
    }

    return result;
}

void HttpServer::stop() {
    listener_.stop();
}

bool HttpServer::is_running() const {
    return listener_.is_running();
}

HttpServer::Stats HttpServer::get_stats() const noexcept {
    Stats stats;
    stats.total_connections = total_connections_;
    stats.active_connections = connections_.size();
    stats.total_requests = requests_on_closed_;
    for (const auto& entry : connections_) {
        stats.total_requests += entry.second->http.requests_served();
    }
    stats.timed_out_connections = timed_out_connections_;
    stats.bytes_received = bytes_received_;
    stats.bytes_sent = bytes_sent_;
    return stats;
}

void HttpServer::on_connection(net::TcpSocket socket, const struct sockaddr_in& peer,
                               net::EventLoop* event_loop) {
    if (socket.set_nonblocking() < 0) {
        LOG_ERROR("Server", "Failed to set non-blocking on fd=%d: %s",
                  socket.fd(), strerror(errno));
        return;
    }
    if (socket.set_nodelay() < 0) {
        LOG_DEBUG("Server", "TCP_NODELAY not set on fd=%d: %s", socket.fd(), strerror(errno));
    }

    char ip[INET_ADDRSTRLEN] = "unknown";
    inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

    int fd = socket.fd();
    auto conn = std::make_unique<ClientConnection>(std::move(socket), ip, config_.max_body_bytes);
    conn->http.set_request_callback([this](const Request& request) {
        return handler_(request);
    });

    if (event_loop->add_fd(fd, net::IOEvent::READ | net::IOEvent::EDGE,
                           [this](int client_fd, net::IOEvent events) {
                               on_client_event(client_fd, events);
                           }) < 0) {
        LOG_ERROR("Server", "Failed to register fd=%d: %s", fd, strerror(errno));
        return;
    }

    total_connections_++;
    connections_[fd] = std::move(conn);
    LOG_DEBUG("Server", "Accepted fd=%d from %s:%u", fd, ip,
              static_cast<unsigned>(ntohs(peer.sin_port)));
}

void HttpServer::on_client_event(int fd, net::IOEvent events) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    ClientConnection& conn = *it->second;

    if (events & net::IOEvent::ERROR) {
        LOG_DEBUG("Server", "Socket error on fd=%d", fd);
        close_connection(fd);
        return;
    }

    if ((events & net::IOEvent::READ) || (events & net::IOEvent::HUP)) {
        if (!read_available(conn)) {
            close_connection(fd);
            return;
        }
    }

    if (!flush(conn) || conn.http.should_close()) {
        close_connection(fd);
    }
}

bool HttpServer::read_available(ClientConnection& conn) {
    uint8_t buffer[16384];

    // Edge-triggered: read until EAGAIN
    while (conn.http.get_state() == Http1State::READING_REQUEST ||
           conn.http.get_state() == Http1State::WRITING_RESPONSE) {
        ssize_t n = conn.socket.recv(buffer, sizeof(buffer));

        if (n > 0) {
            bytes_received_ += static_cast<uint64_t>(n);
            conn.last_activity = std::chrono::steady_clock::now();
            auto result = conn.http.process_input(buffer, static_cast<size_t>(n));
            if (result.is_err()) {
                return false;
            }
            continue;
        }

        if (n == 0) {
            // Peer closed its write side; answer what we have, then close
            conn.http.close_after_flush();
            return true;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        if (errno == EINTR) {
            continue;
        }

        LOG_DEBUG("Server", "recv() failed on fd=%d: %s", conn.socket.fd(), strerror(errno));
        return false;
    }

    return true;
}

bool HttpServer::flush(ClientConnection& conn) {
    const uint8_t* data;
    size_t len;

    while (conn.http.get_output(&data, &len)) {
        ssize_t sent = conn.socket.send(data, len);

        if (sent > 0) {
            bytes_sent_ += static_cast<uint64_t>(sent);
            conn.http.commit_output(static_cast<size_t>(sent));
            conn.last_activity = std::chrono::steady_clock::now();
            continue;
        }

        if (sent < 0 && errno == EINTR) {
            continue;
        }

        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Socket buffer full: wait for WRITE readiness
            if (!conn.write_armed) {
                listener_.event_loop()->modify_fd(conn.socket.fd(),
                    net::IOEvent::READ | net::IOEvent::WRITE | net::IOEvent::EDGE);
                conn.write_armed = true;
            }
            return true;
        }

        LOG_DEBUG("Server", "send() failed on fd=%d: %s", conn.socket.fd(), strerror(errno));
        return false;
    }

    if (conn.write_armed) {
        listener_.event_loop()->modify_fd(conn.socket.fd(),
                                          net::IOEvent::READ | net::IOEvent::EDGE);
        conn.write_armed = false;
    }
    return true;
}

void HttpServer::close_connection(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }

    requests_on_closed_ += it->second->http.requests_served();
    listener_.event_loop()->remove_fd(fd);
    connections_.erase(it);  // Socket closes here
    LOG_DEBUG("Server", "Closed fd=%d", fd);
}

void HttpServer::sweep_idle_connections() {
    if (config_.request_timeout_ms == 0 || connections_.empty()) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto timeout = std::chrono::milliseconds(config_.request_timeout_ms);

    std::vector<int> to_close;
    for (auto& [fd, conn] : connections_) {
        Http1State state = conn->http.get_state();

        if (state == Http1State::CLOSING || state == Http1State::ERROR) {
            // Already had its final response; the peer is not reading it
            if (now - conn->last_activity >= timeout) {
                to_close.push_back(fd);
            }
            continue;
        }

        if (!conn->http.has_partial_request()) {
            if (now - conn->last_activity >= timeout) {
                LOG_DEBUG("Server", "Closing idle keep-alive connection fd=%d", fd);
                to_close.push_back(fd);
            }
            continue;
        }

        // Measured from the request's first byte, not the latest one
        if (now - conn->http.request_started() < timeout) {
            continue;
        }

        LOG_INFO("Server", "Request timeout after %u ms on fd=%d",
                 config_.request_timeout_ms, fd);
        timed_out_connections_++;
        conn->http.queue_timeout_response();
        conn->last_activity = now;
        if (!flush(*conn) || conn->http.should_close()) {
            to_close.push_back(fd);
        }
    }

    for (int fd : to_close) {
        close_connection(fd);
    }
}

} // namespace http
} // namespace hellosvc
