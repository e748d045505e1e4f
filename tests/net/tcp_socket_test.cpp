/**
 * hellosvc TCP Socket Tests
 *
 * RAII ownership, bind/listen/accept on loopback, addresses, timeouts.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/net/tcp_socket.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace hellosvc::net;
using namespace hellosvc::testing;

// =============================================================================
// TcpSocket Test Fixture
// =============================================================================

class TcpSocketTest : public HelloSvcTest {
protected:
    // Listening socket on an ephemeral loopback port
    TcpSocket make_listener(uint16_t& port) {
        TcpSocket listener;
        EXPECT_TRUE(listener.is_valid());
        EXPECT_EQ(listener.set_reuseaddr(), 0);
        EXPECT_EQ(listener.bind("127.0.0.1", 0), 0);
        EXPECT_EQ(listener.listen(16), 0);
        std::string ip;
        EXPECT_TRUE(listener.get_local_address(ip, port));
        EXPECT_EQ(ip, "127.0.0.1");
        return listener;
    }
};

// =============================================================================
// Ownership
// =============================================================================

TEST_F(TcpSocketTest, DefaultConstructedIsValid) {
    TcpSocket sock;
    EXPECT_TRUE(sock.is_valid());
    EXPECT_GE(sock.fd(), 0);
}

TEST_F(TcpSocketTest, CloseInvalidates) {
    TcpSocket sock;
    int fd = sock.fd();
    sock.close();
    EXPECT_FALSE(sock.is_valid());
    EXPECT_EQ(fcntl(fd, F_GETFD), -1);

    sock.close();  // Idempotent
    EXPECT_FALSE(sock.is_valid());
}

TEST_F(TcpSocketTest, MoveTransfersOwnership) {
    TcpSocket a;
    int fd = a.fd();

    TcpSocket b(std::move(a));
    EXPECT_FALSE(a.is_valid());
    EXPECT_EQ(b.fd(), fd);

    TcpSocket c(-1);
    c = std::move(b);
    EXPECT_FALSE(b.is_valid());
    EXPECT_EQ(c.fd(), fd);
}

TEST_F(TcpSocketTest, MoveAssignClosesPrevious) {
    TcpSocket a;
    TcpSocket b;
    int old_fd = b.fd();

    b = std::move(a);
    EXPECT_EQ(fcntl(old_fd, F_GETFD), -1);
    EXPECT_TRUE(b.is_valid());
}

TEST_F(TcpSocketTest, ReleaseGivesUpFd) {
    TcpSocket sock;
    int fd = sock.release();
    EXPECT_FALSE(sock.is_valid());
    EXPECT_NE(fcntl(fd, F_GETFD), -1);
    ::close(fd);
}

TEST_F(TcpSocketTest, InvalidSocketOperationsFailWithEbadf) {
    TcpSocket sock(-1);
    char buf[4];

    errno = 0;
    EXPECT_EQ(sock.bind("127.0.0.1", 0), -1);
    EXPECT_EQ(errno, EBADF);
    EXPECT_EQ(sock.listen(), -1);
    EXPECT_EQ(sock.connect("127.0.0.1", 1), -1);
    EXPECT_EQ(sock.send("x", 1), -1);
    EXPECT_EQ(sock.recv(buf, sizeof(buf)), -1);
    EXPECT_FALSE(sock.accept().is_valid());

    std::string ip;
    uint16_t port = 0;
    EXPECT_FALSE(sock.get_local_address(ip, port));
    EXPECT_FALSE(sock.get_remote_address(ip, port));
}

// =============================================================================
// Options
// =============================================================================

TEST_F(TcpSocketTest, SocketOptions) {
    TcpSocket sock;
    EXPECT_EQ(sock.set_nonblocking(), 0);
    EXPECT_NE(fcntl(sock.fd(), F_GETFL) & O_NONBLOCK, 0);

    EXPECT_EQ(sock.set_nodelay(), 0);
    int opt = 0;
    socklen_t len = sizeof(opt);
    ASSERT_EQ(getsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &opt, &len), 0);
    EXPECT_NE(opt, 0);

    EXPECT_EQ(sock.set_recv_timeout(1500), 0);
    struct timeval tv{};
    len = sizeof(tv);
    ASSERT_EQ(getsockopt(sock.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, &len), 0);
    EXPECT_EQ(tv.tv_sec, 1);
    EXPECT_EQ(tv.tv_usec, 500000);
}

// =============================================================================
// Addresses
// =============================================================================

TEST_F(TcpSocketTest, ResolveIpv4) {
    struct in_addr addr{};

    ASSERT_TRUE(TcpSocket::resolve_ipv4("0.0.0.0", addr));
    EXPECT_EQ(addr.s_addr, htonl(INADDR_ANY));

    ASSERT_TRUE(TcpSocket::resolve_ipv4("", addr));
    EXPECT_EQ(addr.s_addr, htonl(INADDR_ANY));

    ASSERT_TRUE(TcpSocket::resolve_ipv4("10.1.2.3", addr));
    char buf[INET_ADDRSTRLEN];
    EXPECT_STREQ(inet_ntop(AF_INET, &addr, buf, sizeof(buf)), "10.1.2.3");

    ASSERT_TRUE(TcpSocket::resolve_ipv4("localhost", addr));
    EXPECT_EQ(addr.s_addr, htonl(INADDR_LOOPBACK));

    EXPECT_FALSE(TcpSocket::resolve_ipv4("no-such-host.invalid", addr));
}

TEST_F(TcpSocketTest, BindUnresolvableHostFails) {
    TcpSocket sock;
    errno = 0;
    EXPECT_EQ(sock.bind("no-such-host.invalid", 0), -1);
    EXPECT_EQ(errno, EADDRNOTAVAIL);
}

TEST_F(TcpSocketTest, EphemeralBindReportsPort) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);
    EXPECT_NE(port, 0);
}

TEST_F(TcpSocketTest, SecondBindOnBusyPortIsAddrInUse) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket second;
    second.set_reuseaddr();
    errno = 0;
    EXPECT_EQ(second.bind("127.0.0.1", port), -1);
    EXPECT_EQ(errno, EADDRINUSE);
}

// =============================================================================
// Loopback Data Transfer
// =============================================================================

TEST_F(TcpSocketTest, ConnectAcceptAndExchange) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);

    struct sockaddr_in peer{};
    TcpSocket server = listener.accept(&peer);
    ASSERT_TRUE(server.is_valid());
    EXPECT_EQ(peer.sin_addr.s_addr, htonl(INADDR_LOOPBACK));

    std::string ip;
    uint16_t remote_port = 0;
    ASSERT_TRUE(server.get_remote_address(ip, remote_port));
    EXPECT_EQ(ip, "127.0.0.1");

    std::string client_ip;
    uint16_t client_port = 0;
    ASSERT_TRUE(client.get_local_address(client_ip, client_port));
    EXPECT_EQ(remote_port, client_port);

    std::string payload = rng_.random_string(64);
    ASSERT_EQ(client.send_all(payload.data(), payload.size()), 0);

    std::string received;
    char buf[128];
    while (received.size() < payload.size()) {
        ssize_t n = server.recv(buf, sizeof(buf));
        ASSERT_GT(n, 0);
        received.append(buf, static_cast<size_t>(n));
    }
    EXPECT_EQ(received, payload);
}

TEST_F(TcpSocketTest, SendAllLargeBuffer) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = listener.accept();
    ASSERT_TRUE(server.is_valid());

    const size_t total = 4 * 1024 * 1024;
    std::thread reader([&server, total]() {
        size_t got = 0;
        char buf[65536];
        while (got < total) {
            ssize_t n = server.recv(buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            got += static_cast<size_t>(n);
        }
        EXPECT_EQ(got, total);
    });

    std::string big(total, 'z');
    EXPECT_EQ(client.send_all(big.data(), big.size()), 0);
    reader.join();
}

TEST_F(TcpSocketTest, RecvTimeoutExpires) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = listener.accept();
    ASSERT_TRUE(server.is_valid());

    ASSERT_EQ(client.set_recv_timeout(100), 0);
    char buf[8];
    Timer timer;
    timer.start();
    EXPECT_EQ(client.recv(buf, sizeof(buf)), -1);
    EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
    timer.stop();
    EXPECT_GE(timer.elapsed_ms(), 80.0);
}

TEST_F(TcpSocketTest, PeerCloseReadsEof) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = listener.accept();
    ASSERT_TRUE(server.is_valid());

    client.close();
    char buf[8];
    EXPECT_EQ(server.recv(buf, sizeof(buf)), 0);
}

TEST_F(TcpSocketTest, NonblockingAcceptWithoutPendingConnection) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);
    ASSERT_EQ(listener.set_nonblocking(), 0);

    errno = 0;
    EXPECT_FALSE(listener.accept().is_valid());
    EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
}
