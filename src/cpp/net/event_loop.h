/**
 * hellosvc Event Loop - Abstract Interface
 *
 * Readiness-based I/O multiplexing for a single-threaded server.
 * Implementations:
 * - Linux: epoll (EPOLLET for edge-triggered)
 *
 * Design principles:
 * - Non-blocking I/O only
 * - One loop, one thread: handlers never run concurrently
 * - stop() is the only member safe to call from another thread
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace hellosvc {
namespace net {

/**
 * I/O event types
 */
enum class IOEvent {
    READ = 1 << 0,      // Socket readable
    WRITE = 1 << 1,     // Socket writable
    ERROR = 1 << 2,     // Socket error
    HUP = 1 << 3,       // Connection closed
    EDGE = 1 << 4       // Edge-triggered mode
};

inline IOEvent operator|(IOEvent a, IOEvent b) {
    return static_cast<IOEvent>(static_cast<int>(a) | static_cast<int>(b));
}

inline bool operator&(IOEvent a, IOEvent b) {
    return (static_cast<int>(a) & static_cast<int>(b)) != 0;
}

/**
 * Event handler callback
 *
 * Args:
 * - fd: File descriptor that triggered event
 * - events: IOEvent flags (READ, WRITE, ERROR, HUP)
 */
using EventHandler = std::function<void(int fd, IOEvent events)>;

/**
 * Abstract event loop interface
 */
class EventLoop {
public:
    virtual ~EventLoop() = default;

    /**
     * Add file descriptor to event loop
     *
     * @param fd File descriptor to monitor
     * @param events IOEvent flags (READ, WRITE, EDGE)
     * @param handler Callback when event occurs
     * @return 0 on success, -1 on error (check errno)
     */
    virtual int add_fd(int fd, IOEvent events, EventHandler handler) = 0;

    /**
     * Modify events for existing file descriptor
     *
     * @return 0 on success, -1 on error
     */
    virtual int modify_fd(int fd, IOEvent events) = 0;

    /**
     * Remove file descriptor from event loop. Safe to call from inside the
     * fd's own handler.
     *
     * @return 0 on success, -1 on error
     */
    virtual int remove_fd(int fd) = 0;

    /**
     * Run one iteration of the event loop
     *
     * Waits for events (up to timeout_ms) and dispatches handlers.
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = non-blocking)
     * @return Number of events processed, or -1 on error
     */
    virtual int poll(int timeout_ms = -1) = 0;

    /**
     * Run the event loop until stop() is called.
     *
     * @param tick Invoked after every poll() (timers, idle sweeps)
     * @param tick_ms Maximum time between ticks
     */
    virtual void run(const std::function<void()>& tick = {}, int tick_ms = 100) = 0;

    /**
     * Stop the event loop. Thread-safe.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /**
     * errno of the failure that ended run(), 0 if none.
     */
    virtual int last_error() const noexcept = 0;

    /**
     * @return "epoll", ...
     */
    virtual const char* platform_name() const = 0;

    static int set_nonblocking(int fd);
    static int set_tcp_nodelay(int fd);
    static int set_reuseaddr(int fd);
};

/**
 * Create the platform event loop.
 *
 * @return Event loop, or nullptr on error (errno is set)
 */
std::unique_ptr<EventLoop> create_event_loop();

} // namespace net
} // namespace hellosvc
