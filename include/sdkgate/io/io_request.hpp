#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <sys/socket.h>

namespace sdkgate::io {

/// What a suspended coroutine is waiting to do on a descriptor
enum class io_op : uint8_t {
    none = 0,
    accept,
    connect,
    recv,
    send,
    poll_read     ///< Readable, nothing consumed
};

/// Outcome of an operation: a byte count or descriptor, or -errno
struct io_result {
    int32_t result;
    uint32_t flags;

    bool success() const noexcept { return result >= 0; }
    int bytes_transferred() const noexcept { return success() ? result : 0; }
    int error_code() const noexcept { return success() ? 0 : -result; }
};

/// A pending operation as handed to the io_context
struct io_request {
    io_op op = io_op::none;
    int fd = -1;
    void* buffer = nullptr;
    size_t length = 0;
    std::coroutine_handle<> awaiter;
    io_result* completion = nullptr;

    ::sockaddr* addr = nullptr;
    ::socklen_t* addrlen = nullptr;
    int socket_flags = 0;
};

} // namespace sdkgate::io
