/**
 * hellosvc TCP Listener - Implementation
 */

#include "tcp_listener.h"
#include "../core/logger.h"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>

namespace hellosvc {
namespace net {

using core::error_code;

const char* errno_name(int err) noexcept {
    switch (err) {
        case EADDRINUSE:    return "EADDRINUSE";
        case EADDRNOTAVAIL: return "EADDRNOTAVAIL";
        case EACCES:        return "EACCES";
        case EPERM:         return "EPERM";
        case EINVAL:        return "EINVAL";
        case EMFILE:        return "EMFILE";
        case ENFILE:        return "ENFILE";
        case ENOBUFS:       return "ENOBUFS";
        case ENOMEM:        return "ENOMEM";
        case EAFNOSUPPORT:  return "EAFNOSUPPORT";
        case EBADF:         return "EBADF";
        default:            return "UNKNOWN";
    }
}

TcpListener::TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb)
    : config_(config)
    , connection_cb_(std::move(connection_cb))
{
}

TcpListener::~TcpListener() {
    if (event_loop_ && listen_socket_.is_valid()) {
        event_loop_->remove_fd(listen_socket_.fd());
    }
}

core::result<void> TcpListener::bind() {
    auto fail = [this](error_code code) {
        last_errno_ = errno;
        listen_socket_.close();
        return core::err(code);
    };

    event_loop_ = create_event_loop();
    if (!event_loop_) {
        return fail(error_code::bind_failed);
    }

    listen_socket_ = TcpSocket();
    if (!listen_socket_.is_valid()) {
        return fail(error_code::bind_failed);
    }

    if (listen_socket_.set_reuseaddr() < 0) {
        return fail(error_code::bind_failed);
    }

    if (listen_socket_.bind(config_.host, config_.port) < 0) {
        if (errno == EADDRINUSE) {
            return fail(error_code::address_in_use);
        }
        if (errno == EACCES || errno == EPERM) {
            return fail(error_code::permission_denied);
        }
        return fail(error_code::bind_failed);
    }

    if (listen_socket_.listen(config_.backlog) < 0) {
        // Linux reports a port race between bind() and listen() here
        if (errno == EADDRINUSE) {
            return fail(error_code::address_in_use);
        }
        return fail(error_code::bind_failed);
    }

    if (listen_socket_.set_nonblocking() < 0) {
        return fail(error_code::bind_failed);
    }

    std::string ip;
    if (!listen_socket_.get_local_address(ip, bound_port_)) {
        return fail(error_code::bind_failed);
    }

    if (event_loop_->add_fd(listen_socket_.fd(), IOEvent::READ | IOEvent::EDGE,
                            [this](int, IOEvent events) {
                                if (events & IOEvent::READ) {
                                    on_accept_ready();
                                }
                            }) < 0) {
        return fail(error_code::bind_failed);
    }

    LOG_DEBUG("Listener", "Bound %s:%u (fd=%d, %s)", config_.host.c_str(),
              static_cast<unsigned>(bound_port_), listen_socket_.fd(),
              event_loop_->platform_name());
    return core::ok();
}

int TcpListener::run(const std::function<void()>& tick) {
    if (!event_loop_ || !listen_socket_.is_valid()) {
        last_errno_ = EBADF;
        return -1;
    }

    if (stop_requested_.load(std::memory_order_acquire)) {
        return 0;
    }

    event_loop_->run(tick, config_.tick_ms);

    // run() only returns early (without stop()) when epoll_wait fails
    if (stop_requested_.load(std::memory_order_acquire)) {
        return 0;
    }
    last_errno_ = event_loop_->last_error();
    return -1;
}

void TcpListener::stop() {
    stop_requested_.store(true, std::memory_order_release);
    if (event_loop_) {
        event_loop_->stop();
    }
}

bool TcpListener::is_running() const {
    return event_loop_ && event_loop_->is_running();
}

void TcpListener::on_accept_ready() {
    // Edge-triggered: drain the accept queue
    while (true) {
        struct sockaddr_in peer;
        TcpSocket client = listen_socket_.accept(&peer);

        if (!client.is_valid()) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            // EMFILE and friends: leave the rest queued until the next wakeup
            LOG_ERROR("Listener", "accept() failed: %s (%s)", strerror(errno), errno_name(errno));
            break;
        }

        connection_cb_(std::move(client), peer, event_loop_.get());
    }
}

} // namespace net
} // namespace hellosvc
