#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>

namespace sdkgate::log {

enum class level {
    debug,
    info,
    warning,
    error
};

constexpr std::string_view level_name(level lvl) noexcept {
    constexpr std::string_view names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    auto index = static_cast<size_t>(lvl);
    return index < std::size(names) ? names[index] : "UNKNOWN";
}

/// One stderr line: "[2026-01-02T03:04:05.678Z] [INFO] message"
inline std::string format_record(level lvl, std::string_view message,
                                 std::chrono::system_clock::time_point when) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      when.time_since_epoch()).count() % 1000;
    return fmt::format("[{:%Y-%m-%dT%H:%M:%S}.{:03d}Z] [{}] {}",
                       fmt::gmtime(std::chrono::system_clock::to_time_t(when)),
                       millis, level_name(lvl), message);
}

/// Receives formatted messages in place of stderr
using sink_func = std::function<void(level, std::string_view)>;

/// Process-wide logger; records below the threshold are dropped unformatted
class logger {
public:
    static logger& instance() noexcept {
        static logger the_logger;
        return the_logger;
    }

    void set_level(level threshold) noexcept { threshold_.store(threshold, std::memory_order_relaxed); }
    level get_level() const noexcept { return threshold_.load(std::memory_order_relaxed); }

    bool enabled(level lvl) const noexcept { return lvl >= get_level(); }

    void set_sink(sink_func sink) {
        std::lock_guard<std::mutex> guard(mutex_);
        sink_ = std::move(sink);
    }

    void reset_sink() { set_sink(nullptr); }

    template<typename... Args>
    void log(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(lvl)) {
            write(lvl, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    void write(level lvl, std::string_view message) {
        auto now = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> guard(mutex_);
        if (sink_) {
            sink_(lvl, message);
        } else {
            fmt::print(stderr, "{}\n", format_record(lvl, message, now));
        }
    }

private:
    logger() noexcept = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> threshold_{level::info};
    std::mutex mutex_;
    sink_func sink_;
};

} // namespace sdkgate::log
