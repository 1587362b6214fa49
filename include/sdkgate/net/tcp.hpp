#pragma once

#include <sdkgate/io/io_context.hpp>
#include <sdkgate/io/io_awaitables.hpp>
#include <sdkgate/coro/task.hpp>
#include <sdkgate/log/macros.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sdkgate::net {

/// Listening socket options
struct tcp_options {
    bool reuse_addr = true;      ///< SO_REUSEADDR
    bool reuse_port = false;     ///< SO_REUSEPORT
    bool no_delay = true;        ///< TCP_NODELAY on accepted and connected streams
    int backlog = 128;           ///< Listen backlog
};

/// IPv4 endpoint, address kept in network byte order
struct ipv4_address {
    uint32_t addr = INADDR_ANY;
    uint16_t port = 0;

    ipv4_address() = default;

    /// Any interface
    ipv4_address(uint16_t p) : port(p) {}

    /// Dotted-quad literal; empty means any interface
    /// @throws std::invalid_argument if the text is not an IPv4 literal
    ipv4_address(std::string_view ip, uint16_t p) : port(p) {
        if (ip.empty()) {
            return;
        }
        std::string text(ip);
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
            throw std::invalid_argument("not an IPv4 address: " + text);
        }
    }

    ipv4_address(const sockaddr_in& sa)
        : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    sockaddr_in to_sockaddr() const {
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = addr;
        sa.sin_port = htons(port);
        return sa;
    }

    std::string host() const {
        char buf[INET_ADDRSTRLEN] = {};
        in_addr in{};
        in.s_addr = addr;
        inet_ntop(AF_INET, &in, buf, sizeof(buf));
        return buf;
    }

    std::string to_string() const {
        return host() + ":" + std::to_string(port);
    }
};

namespace detail {

/// Owned descriptor registered with an io_context
///
/// Closing cancels whatever is still pending on the descriptor, so a
/// suspended reader or acceptor wakes with ECANCELED instead of hanging.
class socket_handle {
public:
    socket_handle() = default;
    socket_handle(int fd, io::io_context& ctx) noexcept : fd_(fd), ctx_(&ctx) {}

    socket_handle(socket_handle&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), ctx_(other.ctx_) {}

    socket_handle& operator=(socket_handle&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            ctx_ = other.ctx_;
        }
        return *this;
    }

    ~socket_handle() { close(); }

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;

    int fd() const noexcept { return fd_; }
    bool is_valid() const noexcept { return fd_ >= 0; }
    io::io_context& context() const noexcept { return *ctx_; }

    /// Stop owning the descriptor without closing it
    [[nodiscard]] int release() noexcept {
        return std::exchange(fd_, -1);
    }

    void close() noexcept {
        if (fd_ < 0) {
            return;
        }
        if (ctx_) {
            ctx_->cancel_fd(fd_);
        }
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
    io::io_context* ctx_ = nullptr;
};

inline void set_flag(int fd, int level, int option) noexcept {
    int on = 1;
    if (setsockopt(fd, level, option, &on, sizeof(on)) < 0) {
        SDKGATE_LOG_WARNING("setsockopt({}) on fd {} failed: {}", option, fd, strerror(errno));
    }
}

} // namespace detail

/// Connected TCP stream
class tcp_stream {
public:
    tcp_stream(int fd, io::io_context& ctx, ipv4_address peer)
        : socket_(fd, ctx), peer_(peer) {}

    bool is_valid() const noexcept { return socket_.is_valid(); }
    int fd() const noexcept { return socket_.fd(); }

    /// Remote endpoint as seen at accept or connect time
    std::optional<ipv4_address> peer_address() const {
        if (!is_valid()) {
            return std::nullopt;
        }
        return peer_;
    }

    auto read(void* buffer, size_t length) {
        return io::async_recv(socket_.context(), socket_.fd(), buffer, length);
    }

    auto write(const void* buffer, size_t length) {
        return io::async_send(socket_.context(), socket_.fd(), buffer, length);
    }

    auto write(std::string_view str) {
        return io::async_send(socket_.context(), socket_.fd(), str.data(), str.size());
    }

    void close() noexcept { socket_.close(); }

private:
    detail::socket_handle socket_;
    ipv4_address peer_;
};

/// Listening TCP socket
class tcp_listener {
public:
    /// Create a socket, bind it and start listening
    /// @return the listener, or errno on failure
    static std::expected<tcp_listener, int> bind(const ipv4_address& addr, io::io_context& ctx,
                                                 const tcp_options& opts = {}) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::unexpected(errno);
        }
        detail::socket_handle handle(fd, ctx);

        if (opts.reuse_addr) detail::set_flag(fd, SOL_SOCKET, SO_REUSEADDR);
        if (opts.reuse_port) detail::set_flag(fd, SOL_SOCKET, SO_REUSEPORT);

        auto sa = addr.to_sockaddr();
        if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0 ||
            ::listen(fd, opts.backlog) < 0) {
            return std::unexpected(errno);
        }

        // Port 0 binds an ephemeral port; report the real one
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        ipv4_address bound = ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0
                                 ? ipv4_address(local)
                                 : addr;

        SDKGATE_LOG_DEBUG("TCP listener bound to {}", bound.to_string());
        return tcp_listener(std::move(handle), bound, opts);
    }

    bool is_valid() const noexcept { return socket_.is_valid(); }
    int fd() const noexcept { return socket_.fd(); }

    const ipv4_address& local_address() const noexcept { return local_; }

    /// Next incoming connection, or errno (ECANCELED once closed)
    coro::task<std::expected<tcp_stream, int>> accept() {
        if (!is_valid()) {
            co_return std::unexpected(EBADF);
        }

        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        auto result = co_await io::async_accept(socket_.context(), socket_.fd(),
                                                reinterpret_cast<sockaddr*>(&peer), &peer_len,
                                                SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (!result.success()) {
            co_return std::unexpected(result.error_code());
        }

        if (opts_.no_delay) {
            detail::set_flag(result.result, IPPROTO_TCP, TCP_NODELAY);
        }
        SDKGATE_LOG_DEBUG("Accepted connection from {}", ipv4_address(peer).to_string());
        co_return tcp_stream(result.result, socket_.context(), ipv4_address(peer));
    }

    /// Stop listening; a pending accept completes with ECANCELED
    void close() noexcept { socket_.close(); }

private:
    tcp_listener(detail::socket_handle socket, ipv4_address local, tcp_options opts)
        : socket_(std::move(socket)), local_(local), opts_(opts) {}

    detail::socket_handle socket_;
    ipv4_address local_;
    tcp_options opts_;
};

/// Open a connection to a remote endpoint
/// @return the stream, or errno on failure
inline coro::task<std::expected<tcp_stream, int>> tcp_connect(io::io_context& ctx, ipv4_address addr,
                                                              tcp_options opts = {}) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        co_return std::unexpected(errno);
    }
    detail::socket_handle handle(fd, ctx);

    if (opts.no_delay) {
        detail::set_flag(fd, IPPROTO_TCP, TCP_NODELAY);
    }

    auto sa = addr.to_sockaddr();
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0) {
        if (errno != EINPROGRESS) {
            co_return std::unexpected(errno);
        }
        auto result = co_await io::async_connect(ctx, fd);
        if (!result.success()) {
            co_return std::unexpected(result.error_code());
        }
    }

    SDKGATE_LOG_DEBUG("Connected to {}", addr.to_string());

    co_return tcp_stream(handle.release(), ctx, addr);
}

} // namespace sdkgate::net
