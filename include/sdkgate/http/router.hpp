#pragma once

#include <sdkgate/http/http_common.hpp>
#include <sdkgate/http/http_message.hpp>
#include <sdkgate/coro/task.hpp>

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sdkgate::http {

/// Route handler; owns producing the whole response
using handler_func = std::function<coro::task<response>(const request&)>;

/// Synchronous handler function type
using sync_handler_func = std::function<response(const request&)>;

/// Path matcher: an exact string or a pattern anchored at the path start
class route_matcher {
public:
    route_matcher(const char* exact) : source_(exact), matcher_(std::string(exact)) {}
    route_matcher(std::string exact) : source_(exact), matcher_(std::move(exact)) {}
    route_matcher(std::regex pattern, std::string source = "<regex>")
        : source_(std::move(source)), matcher_(std::move(pattern)) {}

    /// Build a pattern matcher from ECMAScript regex syntax
    static route_matcher pattern(std::string_view expr) {
        return route_matcher(std::regex(expr.begin(), expr.end()), std::string(expr));
    }

    bool is_exact() const noexcept {
        return std::holds_alternative<std::string>(matcher_);
    }

    /// Length of the match when the matcher accepts the path
    ///
    /// An exact matcher accepts only the identical path. A pattern accepts
    /// when its leftmost match starts at index 0.
    std::optional<size_t> match(std::string_view path) const {
        if (auto* exact = std::get_if<std::string>(&matcher_)) {
            if (*exact == path) return exact->size();
            return std::nullopt;
        }

        const auto& re = std::get<std::regex>(matcher_);
        std::cmatch m;
        if (std::regex_search(path.data(), path.data() + path.size(), m, re) && m.position(0) == 0) {
            return static_cast<size_t>(m.length(0));
        }
        return std::nullopt;
    }

    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
    std::variant<std::string, std::regex> matcher_;
};

/// Registered route
struct route_entry {
    method http_method;
    route_matcher matcher;
    handler_func handler;
};

/// Ordered, append-only route registry
///
/// resolve() picks among routes whose method and matcher accept the path:
/// exact matchers outrank patterns, the longest pattern match wins, and
/// ties go to the earliest registration.
class route_table {
public:
    route_table() = default;

    /// Append a route with async handler
    void add(method m, route_matcher matcher, handler_func handler) {
        routes_.push_back(route_entry{m, std::move(matcher), std::move(handler)});
    }

    /// Append a route with sync handler
    void add(method m, route_matcher matcher, sync_handler_func handler) {
        add(m, std::move(matcher), handler_func(
            [h = std::move(handler)](const request& req) -> coro::task<response> {
                co_return h(req);
            }));
    }

    /// Find the best route for a request
    const route_entry* resolve(method m, std::string_view path) const {
        const route_entry* best_pattern = nullptr;
        size_t best_length = 0;

        for (const auto& r : routes_) {
            if (r.http_method != m) {
                continue;
            }
            auto length = r.matcher.match(path);
            if (!length) {
                continue;
            }
            if (r.matcher.is_exact()) {
                return &r;
            }
            if (!best_pattern || *length > best_length) {
                best_pattern = &r;
                best_length = *length;
            }
        }

        return best_pattern;
    }

    size_t size() const noexcept { return routes_.size(); }

private:
    std::vector<route_entry> routes_;
};

} // namespace sdkgate::http
