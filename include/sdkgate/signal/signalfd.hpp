#pragma once

/// @file signalfd.hpp
/// @brief Signals delivered as readable events on the event loop
///
/// Normal delivery is blocked and the signals are read from a signalfd,
/// so shutdown runs as an ordinary coroutine rather than in a handler.

#include <sdkgate/io/io_context.hpp>
#include <sdkgate/io/io_awaitables.hpp>
#include <sdkgate/coro/task.hpp>
#include <sdkgate/log/macros.hpp>

#include <fmt/format.h>

#include <sys/signalfd.h>
#include <pthread.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <string>
#include <system_error>

namespace sdkgate::signal {

/// A received signal
struct signal_info {
    int signo = 0;
    pid_t sender = 0;

    /// "SIGTERM", or "SIG<n>" for numbers without a name
    std::string full_name() const {
        const char* abbrev = ::sigabbrev_np(signo);
        return abbrev ? fmt::format("SIG{}", abbrev) : fmt::format("SIG{}", signo);
    }
};

/// Signal numbers as a sigset_t
class signal_set {
public:
    signal_set(std::initializer_list<int> signals = {}) noexcept {
        ::sigemptyset(&mask_);
        for (int signo : signals) {
            ::sigaddset(&mask_, signo);
        }
    }

    signal_set& add(int signo) noexcept {
        ::sigaddset(&mask_, signo);
        return *this;
    }

    bool contains(int signo) const noexcept { return ::sigismember(&mask_, signo) == 1; }

    const sigset_t& mask() const noexcept { return mask_; }

private:
    sigset_t mask_;
};

/// Owns a signalfd for a set of signals blocked on the calling thread
class signal_fd {
public:
    /// @throws std::system_error if blocking or signalfd() fails
    signal_fd(const signal_set& signals, io::io_context& ctx) : ctx_(ctx) {
        if (int err = ::pthread_sigmask(SIG_BLOCK, &signals.mask(), nullptr); err != 0) {
            throw std::system_error(err, std::generic_category(), "pthread_sigmask");
        }
        fd_ = ::signalfd(-1, &signals.mask(), SFD_NONBLOCK | SFD_CLOEXEC);
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "signalfd");
        }
    }

    /// A pending wait() completes with nullopt
    ~signal_fd() {
        ctx_.cancel_fd(fd_);
        ::close(fd_);
    }

    signal_fd(const signal_fd&) = delete;
    signal_fd& operator=(const signal_fd&) = delete;

    int fd() const noexcept { return fd_; }

    /// Next delivered signal, or nullopt once the wait is cancelled
    coro::task<std::optional<signal_info>> wait() {
        auto ready = co_await io::async_wait_readable(ctx_, fd_);
        if (!ready.success()) {
            co_return std::nullopt;
        }

        signalfd_siginfo raw{};
        if (::read(fd_, &raw, sizeof(raw)) != static_cast<ssize_t>(sizeof(raw))) {
            SDKGATE_LOG_WARNING("short read on signalfd {}: {}", fd_, std::strerror(errno));
            co_return std::nullopt;
        }
        co_return signal_info{static_cast<int>(raw.ssi_signo), static_cast<pid_t>(raw.ssi_pid)};
    }

private:
    io::io_context& ctx_;
    int fd_ = -1;
};

} // namespace sdkgate::signal
