/**
 * hellosvc TCP Listener - single event loop acceptor
 *
 * Features:
 * - Synchronous bind() so startup failures are reported before serving
 * - No SO_REUSEPORT: a second listener on a busy port fails with EADDRINUSE
 * - Accepted sockets are handed to a callback on the listener's event loop
 * - Periodic tick for timers (idle connection sweeps)
 */

#pragma once

#include "event_loop.h"
#include "tcp_socket.h"
#include "../core/result.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hellosvc {
namespace net {

/**
 * Connection callback
 *
 * Called on the event loop thread for every accepted connection.
 * @param socket The accepted client socket (blocking mode)
 * @param peer Client address
 * @param event_loop The listener's event loop
 */
using ConnectionCallback = std::function<void(TcpSocket socket, const struct sockaddr_in& peer,
                                              EventLoop* event_loop)>;

struct TcpListenerConfig {
    std::string host = "localhost";    // Bind address
    uint16_t port = 3000;              // Bind port (0 = ephemeral)
    int backlog = 511;                 // Listen backlog
    int tick_ms = 100;                 // Max interval between tick callbacks
};

/**
 * Single-threaded TCP listener
 */
class TcpListener {
public:
    TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb);
    ~TcpListener();

    // Non-copyable, non-movable
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    TcpListener(TcpListener&&) = delete;
    TcpListener& operator=(TcpListener&&) = delete;

    /**
     * Create the event loop and listening socket.
     *
     * @return ok, or address_in_use / permission_denied / bind_failed;
     *         the failing errno is available from last_errno()
     */
    core::result<void> bind();

    /**
     * Accept and dispatch until stop() is called. Requires a successful bind().
     *
     * @param tick Called at least every config.tick_ms on the loop thread
     * @return 0 on clean stop, -1 if not bound or the loop failed
     *         (last_errno() is EBADF or the loop's errno)
     */
    int run(const std::function<void()>& tick = {});

    /**
     * Stop the listener. Thread-safe, and safe before run() has started.
     */
    void stop();

    bool is_running() const;

    /**
     * Port actually bound (differs from config when port 0 was requested)
     */
    uint16_t bound_port() const { return bound_port_; }

    /**
     * errno of the last failed bind() or run()
     */
    int last_errno() const { return last_errno_; }

    const TcpListenerConfig& config() const { return config_; }

    EventLoop* event_loop() const { return event_loop_.get(); }

private:
    void on_accept_ready();

    TcpListenerConfig config_;
    ConnectionCallback connection_cb_;
    std::unique_ptr<EventLoop> event_loop_;
    TcpSocket listen_socket_{-1};
    uint16_t bound_port_{0};
    int last_errno_{0};
    std::atomic<bool> stop_requested_{false};
};

/**
 * Symbolic name for common socket errno values ("EADDRINUSE", ...).
 */
const char* errno_name(int err) noexcept;

} // namespace net
} // namespace hellosvc
