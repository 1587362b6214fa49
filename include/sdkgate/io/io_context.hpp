#pragma once

#include "io_request.hpp"
#include <sdkgate/log/macros.hpp>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <functional>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace sdkgate::io {

/// Readiness reactor over epoll
///
/// Each descriptor keeps a FIFO of waiting readers and one of waiting
/// writers; its epoll interest is whatever those queues need. When epoll
/// reports the descriptor ready the queued syscalls are attempted in
/// order, and every coroutine that got an answer is resumed once the
/// whole batch has been handled.
class io_context {
public:
    using resume_hook = std::function<void(std::coroutine_handle<>)>;

    io_context() {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "epoll_create1");
        }
        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = wake_fd_;
        if (wake_fd_ < 0 || ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
            int err = errno;
            close_descriptors();
            throw std::system_error(err, std::generic_category(), "eventfd");
        }
    }

    ~io_context() {
        cancel_all();
        close_descriptors();
    }

    io_context(const io_context&) = delete;
    io_context& operator=(const io_context&) = delete;

    /// Queue a request until its descriptor is ready
    /// @return false if the operation is not one the reactor knows
    bool prepare(const io_request& req) {
        if (req.op == io_op::none) {
            return false;
        }
        auto& w = watches_[req.fd];
        (is_write(req.op) ? w.writers : w.readers).push_back(req);
        ++pending_;
        rearm(req.fd, w);
        return true;
    }

    /// Wait up to timeout (negative blocks) and complete what became ready
    /// @return completions, or -1 if epoll_wait failed
    int poll(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
        int wait_ms = timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());
        int n = ::epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), wait_ms);
        if (n < 0) {
            if (errno == EINTR) {
                return 0;
            }
            SDKGATE_LOG_ERROR("epoll_wait: {}", std::strerror(errno));
            return -1;
        }

        std::vector<std::coroutine_handle<>> woken;
        for (int i = 0; i < n; ++i) {
            int fd = events_[i].data.fd;
            if (fd == wake_fd_) {
                uint64_t count;
                [[maybe_unused]] auto r = ::read(wake_fd_, &count, sizeof(count));
                continue;
            }
            auto it = watches_.find(fd);
            if (it == watches_.end()) {
                continue;
            }
            uint32_t revents = events_[i].events;
            if (revents & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
                serve(it->second.readers, revents, woken);
            }
            if (revents & (EPOLLOUT | EPOLLHUP | EPOLLERR)) {
                serve(it->second.writers, revents, woken);
            }
            rearm(fd, it->second);
            if (it->second.idle()) {
                watches_.erase(it);
            }
        }

        for (auto h : woken) {
            if (!h.done()) {
                h.resume();
            }
        }
        return static_cast<int>(woken.size());
    }

    bool has_pending() const noexcept { return pending_ > 0; }
    size_t pending_count() const noexcept { return pending_; }

    /// Fail everything waiting on a descriptor with ECANCELED
    size_t cancel_fd(int fd) {
        auto it = watches_.find(fd);
        if (it == watches_.end()) {
            return 0;
        }
        std::vector<std::coroutine_handle<>> woken;
        size_t count = abandon(fd, it->second, woken);
        watches_.erase(it);
        hand_back(woken);
        return count;
    }

    /// Fail every waiting request with ECANCELED
    size_t cancel_all() {
        std::vector<std::coroutine_handle<>> woken;
        size_t count = 0;
        for (auto& [fd, w] : watches_) {
            count += abandon(fd, w, woken);
        }
        watches_.clear();
        hand_back(woken);
        return count;
    }

    /// Interrupt a blocked poll(); async-signal-safe
    void notify() noexcept {
        uint64_t one = 1;
        [[maybe_unused]] auto r = ::write(wake_fd_, &one, sizeof(one));
    }

    /// Where coroutines woken by cancellation go instead of resuming inline
    void set_resume_hook(resume_hook hook) { resume_hook_ = std::move(hook); }

private:
    struct watch {
        std::deque<io_request> readers;
        std::deque<io_request> writers;
        uint32_t armed = 0;

        bool idle() const noexcept { return readers.empty() && writers.empty(); }
    };

    static bool is_write(io_op op) noexcept {
        return op == io_op::send || op == io_op::connect;
    }

    /// Bring the epoll interest of fd in line with what is queued on it
    void rearm(int fd, watch& w) {
        uint32_t wanted = (w.readers.empty() ? 0u : uint32_t(EPOLLIN)) |
                          (w.writers.empty() ? 0u : uint32_t(EPOLLOUT));
        if (wanted == w.armed) {
            return;
        }
        epoll_event ev{};
        ev.events = wanted;
        ev.data.fd = fd;
        int op = wanted == 0 ? EPOLL_CTL_DEL : (w.armed == 0 ? EPOLL_CTL_ADD : EPOLL_CTL_MOD);
        if (::epoll_ctl(epoll_fd_, op, fd, &ev) < 0) {
            SDKGATE_LOG_WARNING("epoll_ctl on fd {}: {}", fd, std::strerror(errno));
        }
        w.armed = wanted;
    }

    /// Attempt queued requests in order until one would block
    void serve(std::deque<io_request>& queue, uint32_t revents,
               std::vector<std::coroutine_handle<>>& woken) {
        while (!queue.empty()) {
            auto outcome = attempt(queue.front(), revents);
            if (outcome.result == -EAGAIN || outcome.result == -EWOULDBLOCK) {
                return;
            }
            settle(queue.front(), outcome, woken);
            queue.pop_front();
            --pending_;
        }
    }

    static io_result attempt(const io_request& req, uint32_t revents) {
        auto socket_error = [&]() -> int {
            int err = 0;
            socklen_t len = sizeof(err);
            if (::getsockopt(req.fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                return errno;
            }
            return err;
        };

        if (revents & EPOLLERR) {
            int err = socket_error();
            return {-(err != 0 ? err : EIO), 0};
        }

        ssize_t n = 0;
        switch (req.op) {
            case io_op::recv:
                n = ::recv(req.fd, req.buffer, req.length, req.socket_flags);
                break;
            case io_op::send:
                if (revents & EPOLLHUP) {
                    return {-EPIPE, 0};
                }
                n = ::send(req.fd, req.buffer, req.length, req.socket_flags | MSG_NOSIGNAL);
                break;
            case io_op::accept:
                n = ::accept4(req.fd, req.addr, req.addrlen, req.socket_flags | SOCK_CLOEXEC);
                break;
            case io_op::connect:
                return {-socket_error(), 0};
            case io_op::poll_read:
                return {0, 0};
            case io_op::none:
                return {-ENOTSUP, 0};
        }
        return {n < 0 ? -errno : static_cast<int32_t>(n), 0};
    }

    static void settle(const io_request& req, io_result outcome,
                       std::vector<std::coroutine_handle<>>& woken) {
        if (req.completion) {
            *req.completion = outcome;
        }
        if (req.awaiter) {
            woken.push_back(req.awaiter);
        }
    }

    size_t abandon(int fd, watch& w, std::vector<std::coroutine_handle<>>& woken) {
        size_t count = 0;
        for (auto* queue : {&w.readers, &w.writers}) {
            for (const auto& req : *queue) {
                settle(req, io_result{-ECANCELED, 0}, woken);
                ++count;
            }
            queue->clear();
        }
        rearm(fd, w);
        pending_ -= count;
        return count;
    }

    /// Cancellation runs outside a poll batch, so resumption is deferred to the owner
    void hand_back(const std::vector<std::coroutine_handle<>>& woken) {
        for (auto h : woken) {
            if (resume_hook_) {
                resume_hook_(h);
            } else if (!h.done()) {
                h.resume();
            }
        }
    }

    void close_descriptors() noexcept {
        if (wake_fd_ >= 0) ::close(wake_fd_);
        if (epoll_fd_ >= 0) ::close(epoll_fd_);
        wake_fd_ = epoll_fd_ = -1;
    }

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::array<epoll_event, 256> events_{};
    std::unordered_map<int, watch> watches_;
    size_t pending_ = 0;
    resume_hook resume_hook_;
};

} // namespace sdkgate::io
