/**
 * hellosvc TCP Listener Tests
 *
 * Synchronous bind() errors, accept dispatch and run()/stop() lifecycle.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/net/tcp_listener.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace hellosvc::net;
using namespace hellosvc::testing;
using hellosvc::core::error_code;

// =============================================================================
// TcpListener Test Fixture
// =============================================================================

class TcpListenerTest : public HelloSvcTest {
protected:
    TcpListenerConfig config_;

    void SetUp() override {
        HelloSvcTest::SetUp();
        config_.host = "127.0.0.1";
        config_.port = 0;
        config_.tick_ms = 10;
    }

    static ConnectionCallback ignore_connections() {
        return [](TcpSocket, const struct sockaddr_in&, EventLoop*) {};
    }
};

// =============================================================================
// bind()
// =============================================================================

TEST_F(TcpListenerTest, EphemeralBindSetsBoundPort) {
    TcpListener listener(config_, ignore_connections());
    EXPECT_EQ(listener.bound_port(), 0);

    auto bound = listener.bind();
    ASSERT_TRUE(bound.is_ok());
    EXPECT_NE(listener.bound_port(), 0);
    ASSERT_NE(listener.event_loop(), nullptr);
    EXPECT_STREQ(listener.event_loop()->platform_name(), "epoll");
    EXPECT_FALSE(listener.is_running());
}

TEST_F(TcpListenerTest, BusyPortIsAddressInUse) {
    TcpListener first(config_, ignore_connections());
    ASSERT_TRUE(first.bind().is_ok());

    TcpListenerConfig same = config_;
    same.port = first.bound_port();
    TcpListener second(same, ignore_connections());

    auto bound = second.bind();
    ASSERT_TRUE(bound.is_err());
    EXPECT_EQ(bound.error(), error_code::address_in_use);
    EXPECT_EQ(second.last_errno(), EADDRINUSE);
    EXPECT_EQ(second.run(), -1);
}

TEST_F(TcpListenerTest, UnresolvableHostIsBindFailed) {
    config_.host = "no-such-host.invalid";
    TcpListener listener(config_, ignore_connections());

    auto bound = listener.bind();
    ASSERT_TRUE(bound.is_err());
    EXPECT_EQ(bound.error(), error_code::bind_failed);
    EXPECT_EQ(listener.last_errno(), EADDRNOTAVAIL);
}

// =============================================================================
// run() / stop()
// =============================================================================

TEST_F(TcpListenerTest, RunWithoutBindFails) {
    TcpListener listener(config_, ignore_connections());
    EXPECT_EQ(listener.run(), -1);
    EXPECT_EQ(listener.last_errno(), EBADF);
}

TEST_F(TcpListenerTest, LoopFailureReportsLoopErrno) {
    std::vector<int> before = open_epoll_fds();
    TcpListener listener(config_, ignore_connections());
    ASSERT_TRUE(listener.bind().is_ok());

    std::vector<int> created;
    for (int fd : open_epoll_fds()) {
        if (std::find(before.begin(), before.end(), fd) == before.end()) {
            created.push_back(fd);
        }
    }
    ASSERT_EQ(created.size(), 1u);

    // errno left over from elsewhere must not leak into the result
    int ticks = 0;
    int result = listener.run([&ticks, &created]() {
        if (ticks++ == 0) {
            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            ASSERT_GE(devnull, 0);
            ASSERT_EQ(::dup2(devnull, created[0]), created[0]);
            ::close(devnull);
            errno = ENOENT;
        }
    });

    EXPECT_EQ(result, -1);
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(listener.last_errno(), EINVAL);
    EXPECT_FALSE(listener.is_running());
}

TEST_F(TcpListenerTest, StopBeforeRunReturnsZero) {
    TcpListener listener(config_, ignore_connections());
    ASSERT_TRUE(listener.bind().is_ok());

    listener.stop();
    int ticks = 0;
    EXPECT_EQ(listener.run([&ticks]() { ticks++; }), 0);
    EXPECT_EQ(ticks, 0);
}

TEST_F(TcpListenerTest, StopFromAnotherThread) {
    TcpListener listener(config_, ignore_connections());
    ASSERT_TRUE(listener.bind().is_ok());

    std::atomic<int> ticks{0};
    std::atomic<int> result{-100};
    std::thread loop_thread([&]() {
        result = listener.run([&ticks]() { ticks++; });
    });

    while (ticks.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(listener.is_running());

    listener.stop();
    loop_thread.join();
    EXPECT_EQ(result.load(), 0);
    EXPECT_FALSE(listener.is_running());
}

// =============================================================================
// Accept dispatch
// =============================================================================

TEST_F(TcpListenerTest, AcceptedSocketsReachCallback) {
    std::atomic<int> accepted{0};
    std::atomic<bool> loopback_peer{true};

    TcpListener* self = nullptr;
    TcpListener listener(config_, [&](TcpSocket socket, const struct sockaddr_in& peer,
                                      EventLoop* loop) {
        if (!socket.is_valid() || loop != self->event_loop() ||
            peer.sin_addr.s_addr != htonl(INADDR_LOOPBACK)) {
            loopback_peer = false;
        }
        const char reply[] = "hi";
        socket.send_all(reply, 2);
        accepted++;
    });
    self = &listener;
    ASSERT_TRUE(listener.bind().is_ok());

    std::thread loop_thread([&]() { listener.run(); });

    constexpr int kClients = 3;
    for (int i = 0; i < kClients; ++i) {
        TestClient client;
        ASSERT_TRUE(client.connect(listener.bound_port()));
        EXPECT_EQ(client.read_all(), "hi");
    }

    listener.stop();
    loop_thread.join();

    EXPECT_EQ(accepted.load(), kClients);
    EXPECT_TRUE(loopback_peer.load());
}

// =============================================================================
// errno_name
// =============================================================================

TEST(ErrnoNameTest, KnownAndUnknown) {
    EXPECT_STREQ(errno_name(EADDRINUSE), "EADDRINUSE");
    EXPECT_STREQ(errno_name(EACCES), "EACCES");
    EXPECT_STREQ(errno_name(EADDRNOTAVAIL), "EADDRNOTAVAIL");
    EXPECT_STREQ(errno_name(0), "UNKNOWN");
}
