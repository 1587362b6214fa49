#pragma once

#include <sdkgate/coro/task.hpp>
#include <sdkgate/io/io_context.hpp>
#include <sdkgate/log/macros.hpp>

#include <atomic>
#include <chrono>
#include <coroutine>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sdkgate::runtime {

namespace detail {

/// Completion state shared between run() and its wrapper coroutine
template<typename T>
struct completion_state {
    std::optional<T> result;
    std::exception_ptr exception;
    bool completed = false;

    T take() {
        if (exception) {
            std::rethrow_exception(exception);
        }
        return std::move(*result);
    }
};

template<>
struct completion_state<void> {
    std::exception_ptr exception;
    bool completed = false;

    void take() {
        if (exception) {
            std::rethrow_exception(exception);
        }
    }
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, std::shared_ptr<completion_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
        } else {
            state->result.emplace(co_await std::move(inner));
        }
    } catch (...) {
        state->exception = std::current_exception();
    }
    state->completed = true;
}

} // namespace detail

/// Single-threaded cooperative event loop
///
/// Coroutines scheduled on the loop interleave only at suspension points
/// (I/O or an explicit reschedule); one loop owns one io_context.
class event_loop {
public:
    event_loop() {
        io_.set_resume_hook([this](std::coroutine_handle<> h) { schedule(h); });
    }

    ~event_loop() {
        // Unwind everything still suspended on I/O while the loop is alive
        auto* previous = std::exchange(current_, this);
        io_.cancel_all();
        drain_ready();
        io_.set_resume_hook(nullptr);
        current_ = previous;
    }

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    /// The loop driving the calling coroutine, if any
    [[nodiscard]] static event_loop* current() noexcept {
        return current_;
    }

    io::io_context& io_context() noexcept { return io_; }

    /// Queue a coroutine for resumption on the next turn
    void schedule(std::coroutine_handle<> handle) {
        if (handle) {
            ready_.push_back(handle);
        }
    }

    /// Ask run() to return; safe to call from a signal handler
    void request_stop() noexcept {
        stop_requested_.store(true, std::memory_order_relaxed);
        io_.notify();
    }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_relaxed);
    }

    /// Drive the loop until the task completes and return its result
    ///
    /// On request_stop() pending I/O is cancelled so suspended tasks unwind;
    /// if the task still has not completed, std::runtime_error is thrown.
    template<typename T>
    T run(coro::task<T> t) {
        auto state = std::make_shared<detail::completion_state<T>>();
        auto* previous = std::exchange(current_, this);

        schedule(detail::completion_wrapper(std::move(t), state).release());

        try {
            while (!state->completed) {
                drain_ready();
                if (state->completed) {
                    break;
                }
                if (stop_requested()) {
                    SDKGATE_LOG_DEBUG("event loop stop requested, cancelling {} operations",
                                      io_.pending_count());
                    io_.cancel_all();
                    drain_ready();
                    break;
                }
                if (!io_.has_pending()) {
                    throw std::runtime_error("event loop deadlock: task suspended without pending I/O");
                }
                if (io_.poll(std::chrono::milliseconds(-1)) < 0) {
                    throw std::runtime_error("event loop poll failed");
                }
            }
        } catch (...) {
            current_ = previous;
            throw;
        }

        current_ = previous;
        stop_requested_.store(false, std::memory_order_relaxed);

        if (!state->completed) {
            throw std::runtime_error("event loop stopped before task completed");
        }
        return state->take();
    }

private:
    void drain_ready() {
        while (!ready_.empty()) {
            auto handle = ready_.front();
            ready_.pop_front();
            if (!handle.done()) {
                handle.resume();
            }
        }
    }

    io::io_context io_;
    std::deque<std::coroutine_handle<>> ready_;
    std::atomic<bool> stop_requested_{false};

    static inline thread_local event_loop* current_ = nullptr;
};

/// Schedule on the current loop, or run synchronously when there is none
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) return;

    auto* loop = event_loop::current();
    if (loop) {
        loop->schedule(handle);
    } else if (!handle.done()) {
        handle.resume();
    }
}

/// The io_context of the current loop; throws outside a loop
inline io::io_context& current_io_context() {
    auto* loop = event_loop::current();
    if (!loop) {
        throw std::logic_error("no event loop is running on this thread");
    }
    return loop->io_context();
}

/// Awaitable that yields to other ready tasks
struct yield_awaitable {
    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> h) const noexcept { schedule_handle(h); }
    void await_resume() const noexcept {}
};

inline yield_awaitable yield() noexcept { return {}; }

} // namespace sdkgate::runtime
