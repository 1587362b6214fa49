#pragma once

#include "io_context.hpp"
#include <coroutine>
#include <cerrno>
#include <sys/socket.h>

namespace sdkgate::io {

/// One backend request, suspended on until the backend completes it
///
/// The backend writes the outcome through req.completion before the
/// awaiting coroutine is resumed; a request the backend refuses resumes
/// at once with -EINVAL.
class operation {
public:
    operation(io_context& ctx, const io_request& req) noexcept
        : ctx_(ctx), req_(req) {}

    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        req_.awaiter = awaiter;
        req_.completion = &result_;
        if (!ctx_.prepare(req_)) {
            result_ = io_result{-EINVAL, 0};
            return false;
        }
        return true;
    }

    io_result await_resume() const noexcept { return result_; }

private:
    io_context& ctx_;
    io_request req_;
    io_result result_{};
};

namespace detail {

inline io_request make_request(io_op op, int fd) noexcept {
    io_request req{};
    req.op = op;
    req.fd = fd;
    return req;
}

} // namespace detail

/// Receive into a buffer; result is the byte count, 0 on orderly shutdown
inline operation async_recv(io_context& ctx, int fd, void* buffer, size_t length, int flags = 0) {
    auto req = detail::make_request(io_op::recv, fd);
    req.buffer = buffer;
    req.length = length;
    req.socket_flags = flags;
    return operation(ctx, req);
}

/// Send from a buffer; may transfer fewer bytes than asked
inline operation async_send(io_context& ctx, int fd, const void* buffer, size_t length, int flags = 0) {
    auto req = detail::make_request(io_op::send, fd);
    req.buffer = const_cast<void*>(buffer);
    req.length = length;
    req.socket_flags = flags;
    return operation(ctx, req);
}

/// Accept on a listening socket; result is the new descriptor
inline operation async_accept(io_context& ctx, int listen_fd, ::sockaddr* addr = nullptr,
                              ::socklen_t* addrlen = nullptr, int flags = 0) {
    auto req = detail::make_request(io_op::accept, listen_fd);
    req.addr = addr;
    req.addrlen = addrlen;
    req.socket_flags = flags;
    return operation(ctx, req);
}

/// Finish a non-blocking connect already in progress
inline operation async_connect(io_context& ctx, int fd) {
    return operation(ctx, detail::make_request(io_op::connect, fd));
}

/// Wait until a descriptor is readable without consuming anything
inline operation async_wait_readable(io_context& ctx, int fd) {
    return operation(ctx, detail::make_request(io_op::poll_read, fd));
}

} // namespace sdkgate::io
