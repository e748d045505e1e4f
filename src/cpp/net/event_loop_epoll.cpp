/**
 * hellosvc Event Loop - epoll Implementation (Linux)
 *
 * Features:
 * - Edge-triggered mode (EPOLLET)
 * - EPOLLRDHUP for peer shutdown detection
 * - Handlers may remove their own fd while running
 */

#if defined(__linux__)

#include "event_loop.h"
#include "../core/logger.h"
#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <memory>
#include <unordered_map>
#include <vector>

namespace hellosvc {
namespace net {

struct EventHandlerData {
    EventHandler handler;
    IOEvent events;  // Registered events
};

class EpollEventLoop : public EventLoop {
public:
    EpollEventLoop() = default;

    ~EpollEventLoop() override {
        if (epoll_fd_ >= 0) {
            close(epoll_fd_);
        }
    }

    bool init() {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            return false;
        }
        events_.resize(64);
        return true;
    }

    int add_fd(int fd, IOEvent events, EventHandler handler) override {
        if (fd < 0 || !handler) {
            errno = EINVAL;
            return -1;
        }

        if (update_epoll_events(fd, events, false) < 0) {
            return -1;
        }

        auto data = std::make_shared<EventHandlerData>();
        data->handler = std::move(handler);
        data->events = events;
        handlers_[fd] = std::move(data);
        return 0;
    }

    int modify_fd(int fd, IOEvent events) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        it->second->events = events;
        return update_epoll_events(fd, events, true);
    }

    int remove_fd(int fd) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        struct epoll_event ev{};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, &ev) < 0) {
            // ENOENT (already removed) and EBADF (fd already closed) are fine
            if (errno != ENOENT && errno != EBADF) {
                return -1;
            }
        }

        handlers_.erase(it);
        return 0;
    }

    int poll(int timeout_ms) override {
        int n_events = epoll_wait(epoll_fd_, events_.data(),
                                  static_cast<int>(events_.size()), timeout_ms);

        if (n_events < 0) {
            if (errno == EINTR) {
                return 0;  // Signal delivered, not an error
            }
            return -1;
        }

        for (int i = 0; i < n_events; i++) {
            struct epoll_event& ev = events_[i];
            int fd = ev.data.fd;

            auto it = handlers_.find(fd);
            if (it == handlers_.end()) {
                continue;  // Removed by an earlier handler in this batch
            }

            IOEvent event_type = static_cast<IOEvent>(0);
            if (ev.events & EPOLLIN) {
                event_type = IOEvent::READ;
            }
            if (ev.events & EPOLLOUT) {
                event_type = event_type | IOEvent::WRITE;
            }
            if (ev.events & (EPOLLHUP | EPOLLRDHUP)) {
                event_type = event_type | IOEvent::HUP;
            }
            if (ev.events & EPOLLERR) {
                event_type = event_type | IOEvent::ERROR;
            }

            // Keep the handler alive even if it removes itself
            std::shared_ptr<EventHandlerData> data = it->second;
            data->handler(fd, event_type);
        }

        if (n_events == static_cast<int>(events_.size())) {
            events_.resize(events_.size() * 2);
        }

        return n_events;
    }

    void run(const std::function<void()>& tick, int tick_ms) override {
        running_.store(true, std::memory_order_release);

        // A stop() issued before run() started still takes effect
        while (!stop_requested_.load(std::memory_order_acquire)) {
            if (poll(tick_ms) < 0) {
                last_error_ = errno;
                LOG_ERROR("EventLoop", "epoll_wait() failed: %s", strerror(last_error_));
                break;
            }
            if (tick) {
                tick();
            }
        }

        running_.store(false, std::memory_order_release);
    }

    void stop() override {
        stop_requested_.store(true, std::memory_order_release);
    }

    bool is_running() const override {
        return running_.load(std::memory_order_acquire);
    }

    int last_error() const noexcept override {
        return last_error_;
    }

    const char* platform_name() const override {
        return "epoll";
    }

private:
    int update_epoll_events(int fd, IOEvent events, bool modify) {
        struct epoll_event ev{};
        ev.data.fd = fd;

        if (events & IOEvent::READ) {
            ev.events |= EPOLLIN;
        }
        if (events & IOEvent::WRITE) {
            ev.events |= EPOLLOUT;
        }
        if (events & IOEvent::EDGE) {
            ev.events |= EPOLLET;
        }
        ev.events |= EPOLLRDHUP;

        int op = modify ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
        return epoll_ctl(epoll_fd_, op, fd, &ev);
    }

    int epoll_fd_{-1};
    std::unordered_map<int, std::shared_ptr<EventHandlerData>> handlers_;
    std::vector<struct epoll_event> events_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    int last_error_{0};
};

std::unique_ptr<EventLoop> create_epoll_event_loop() {
    auto loop = std::make_unique<EpollEventLoop>();
    if (!loop->init()) {
        return nullptr;
    }
    return loop;
}

} // namespace net
} // namespace hellosvc

#endif // __linux__
