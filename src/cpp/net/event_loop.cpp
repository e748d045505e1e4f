/**
 * hellosvc Event Loop - Common Implementation
 *
 * Factory function and socket option helpers.
 */

#include "event_loop.h"
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <cerrno>

#if defined(__linux__)
    #define HAVE_EPOLL 1
#endif

namespace hellosvc {
namespace net {

#ifdef HAVE_EPOLL
std::unique_ptr<EventLoop> create_epoll_event_loop();
#endif

std::unique_ptr<EventLoop> create_event_loop() {
#ifdef HAVE_EPOLL
    return create_epoll_event_loop();
#else
    #error "Unsupported platform: epoll required"
#endif
}

int EventLoop::set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return -1;
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return -1;
    }

    return 0;
}

/**
 * Helper: Disable Nagle's algorithm (enable TCP_NODELAY)
 */
int EventLoop::set_tcp_nodelay(int fd) {
    int enable = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) < 0) {
        return -1;
    }
    return 0;
}

/**
 * Helper: Enable SO_REUSEADDR
 *
 * Allows rebinding while old connections sit in TIME_WAIT. Unlike
 * SO_REUSEPORT it does not let two live listeners share a port.
 */
int EventLoop::set_reuseaddr(int fd) {
    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        return -1;
    }
    return 0;
}

} // namespace net
} // namespace hellosvc
