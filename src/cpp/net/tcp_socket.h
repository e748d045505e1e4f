/**
 * hellosvc TCP Socket - RAII wrapper around an IPv4 stream socket
 */

#pragma once

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>

namespace hellosvc {
namespace net {

/**
 * TCP Socket abstraction
 *
 * Owns its file descriptor. Calls return -1 and leave errno set on failure,
 * matching the underlying syscalls.
 */
class TcpSocket {
public:
    /**
     * Adopt an existing file descriptor (takes ownership).
     */
    explicit TcpSocket(int fd);

    /**
     * Create a new TCP socket
     */
    TcpSocket();

    ~TcpSocket();

    // Non-copyable, movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    int fd() const { return fd_; }
    bool is_valid() const { return fd_ >= 0; }

    void close();

    int set_nonblocking();
    int set_nodelay();
    int set_reuseaddr();

    /**
     * Set SO_RCVTIMEO (blocking sockets only)
     */
    int set_recv_timeout(int timeout_ms);

    /**
     * Connect to a remote address
     * @param host Hostname or dotted IPv4 address
     * @param port Port number
     * @return 0 on success (or EINPROGRESS on a non-blocking socket), -1 on error
     */
    int connect(const std::string& host, uint16_t port);

    /**
     * Bind to local address
     * @param host "0.0.0.0"/empty for any, "localhost", or a dotted IPv4 address
     * @param port Local port (0 = ephemeral)
     * @return 0 on success, -1 on error
     */
    int bind(const std::string& host, uint16_t port);

    int listen(int backlog = 511);

    /**
     * Accept a new connection
     * @return New TcpSocket for the connection, invalid socket on error
     */
    TcpSocket accept(struct sockaddr_in* client_addr = nullptr);

    ssize_t send(const void* data, size_t len, int flags = MSG_NOSIGNAL);
    ssize_t recv(void* buffer, size_t len, int flags = 0);

    /**
     * Send the whole buffer on a blocking socket.
     * @return 0 on success, -1 on error
     */
    int send_all(const void* data, size_t len);

    bool get_local_address(std::string& ip, uint16_t& port) const;
    bool get_remote_address(std::string& ip, uint16_t& port) const;

    /**
     * Release ownership of the file descriptor
     */
    int release();

    /**
     * Resolve host to an IPv4 address ("localhost" and dotted quads included).
     * @return true on success
     */
    static bool resolve_ipv4(const std::string& host, struct in_addr& out);

private:
    int fd_;
};

} // namespace net
} // namespace hellosvc
