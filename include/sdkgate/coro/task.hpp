#pragma once

#include <coroutine>
#include <optional>
#include <exception>
#include <utility>
#include <type_traits>

namespace sdkgate::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace sdkgate::coro {

template<typename T = void>
class task;

namespace detail {

/// State every task promise carries
struct promise_base {
    std::coroutine_handle<> continuation_;   ///< Awaiting coroutine, resumed at the end
    std::exception_ptr exception_;           ///< Escaped exception, rethrown to the awaiter
    bool detached_ = false;                  ///< Released by go(); frees itself when done

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }
};

/// Result storage; the void case has nothing to hand back
template<typename T>
struct result_promise : promise_base {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }

    T take() {
        rethrow_if_failed();
        return std::move(*value_);
    }
};

template<>
struct result_promise<void> : promise_base {
    void return_void() noexcept {}

    void take() {
        rethrow_if_failed();
    }
};

/// Transfers control to the awaiter, or frees a finished detached task
struct final_awaiter {
    bool await_ready() const noexcept { return false; }

    template<typename Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.continuation_) {
            return promise.continuation_;
        }
        if (promise.detached_) {
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

} // namespace detail

/// Lazily started coroutine producing a T
///
/// Nothing runs until the task is awaited or handed to the event loop
/// with go(). The task owns its frame unless released.
template<typename T>
class task {
public:
    struct promise_type : detail::result_promise<T> {
        task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }
        detail::final_awaiter final_suspend() noexcept { return {}; }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}

    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { reset(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself on completion
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) {
            handle_.promise().detached_ = true;
        }
        return std::exchange(handle_, nullptr);
    }

    /// Detach and queue on the current event loop
    void go() {
        runtime::schedule_handle(release());
    }

    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        return handle_.promise().take();
    }

private:
    void reset() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    handle_type handle_;
};

} // namespace sdkgate::coro
