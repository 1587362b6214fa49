#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdkgate::http {

enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE collides with a macro on some platforms
    CONNECT,
    OPTIONS,
    TRACE,
    PATCH
};

namespace detail {

inline constexpr std::array<std::string_view, 9> method_names = {
    "GET", "HEAD", "POST", "PUT", "DELETE", "CONNECT", "OPTIONS", "TRACE", "PATCH"
};

constexpr char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace detail

inline constexpr std::string_view method_to_string(method m) noexcept {
    auto index = static_cast<size_t>(m);
    return index < detail::method_names.size() ? detail::method_names[index] : "UNKNOWN";
}

/// Method token from a request line; tokens are case-sensitive
inline std::optional<method> string_to_method(std::string_view token) noexcept {
    for (size_t i = 0; i < detail::method_names.size(); ++i) {
        if (detail::method_names[i] == token) {
            return static_cast<method>(i);
        }
    }
    return std::nullopt;
}

/// Status codes the gateway produces
enum class status : uint16_t {
    ok = 200,
    no_content = 204,
    not_modified = 304,
    bad_request = 400,
    forbidden = 403,
    not_found = 404,
    method_not_allowed = 405,
    payload_too_large = 413,
    internal_server_error = 500,
    not_implemented = 501,
    service_unavailable = 503
};

inline constexpr std::string_view status_reason(status s) noexcept {
    constexpr std::pair<status, std::string_view> reasons[] = {
        {status::ok, "OK"},
        {status::no_content, "No Content"},
        {status::not_modified, "Not Modified"},
        {status::bad_request, "Bad Request"},
        {status::forbidden, "Forbidden"},
        {status::not_found, "Not Found"},
        {status::method_not_allowed, "Method Not Allowed"},
        {status::payload_too_large, "Payload Too Large"},
        {status::internal_server_error, "Internal Server Error"},
        {status::not_implemented, "Not Implemented"},
        {status::service_unavailable, "Service Unavailable"},
    };
    for (const auto& [code, reason] : reasons) {
        if (code == s) {
            return reason;
        }
    }
    return "Unknown";
}

inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::transform(s.begin(), s.end(), std::back_inserter(out), detail::ascii_lower);
    return out;
}

/// Drop surrounding spaces and tabs
inline std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view blanks = " \t";
    auto first = s.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(blanks);
    return s.substr(first, last - first + 1);
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return detail::ascii_lower(x) == detail::ascii_lower(y);
           });
}

/// Header fields in arrival order, looked up case-insensitively
///
/// A name appears at most once. Repeated fields are folded into one
/// comma-separated value, which is how they go back out on the wire.
class headers {
public:
    using field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<field>::const_iterator;

    /// Replace the value of a field, keeping its position if present
    void set(std::string_view name, std::string_view value) {
        if (auto* existing = find(name)) {
            existing->second.assign(value);
        } else {
            fields_.emplace_back(name, value);
        }
    }

    /// Append to a field with a comma, or create it
    void add(std::string_view name, std::string_view value) {
        if (auto* existing = find(name)) {
            existing->second.append(", ").append(value);
        } else {
            fields_.emplace_back(name, value);
        }
    }

    /// Field value, empty when absent
    std::string_view get(std::string_view name) const {
        const auto* f = find(name);
        return f ? std::string_view(f->second) : std::string_view{};
    }

    bool contains(std::string_view name) const { return find(name) != nullptr; }

    void remove(std::string_view name) {
        std::erase_if(fields_, [name](const field& f) { return iequals(f.first, name); });
    }

    /// Content-Length as a number; nullopt when absent or not all digits
    std::optional<size_t> content_length() const {
        auto text = get("Content-Length");
        size_t length = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, length);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return length;
    }

    void set_content_length(size_t length) { set("Content-Length", std::to_string(length)); }

    std::string_view content_type() const { return get("Content-Type"); }
    void set_content_type(std::string_view type) { set("Content-Type", type); }

    bool is_chunked() const {
        return to_lower(get("Transfer-Encoding")).find("chunked") != std::string::npos;
    }

    /// Persistence per the Connection field, falling back to the version default
    bool keep_alive(std::string_view version = "HTTP/1.1") const {
        auto connection = to_lower(get("Connection"));
        if (connection.find("close") != std::string::npos) {
            return false;
        }
        if (connection.find("keep-alive") != std::string::npos) {
            return true;
        }
        return version == "HTTP/1.1" || version == "1.1";
    }

    void clear() noexcept { fields_.clear(); }
    size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }

    const_iterator begin() const noexcept { return fields_.begin(); }
    const_iterator end() const noexcept { return fields_.end(); }

    /// "Name: value\r\n" per field
    std::string serialize() const {
        std::string out;
        for (const auto& [name, value] : fields_) {
            out.append(name).append(": ").append(value).append("\r\n");
        }
        return out;
    }

private:
    field* find(std::string_view name) {
        auto it = std::find_if(fields_.begin(), fields_.end(),
                               [name](const field& f) { return iequals(f.first, name); });
        return it == fields_.end() ? nullptr : &*it;
    }

    const field* find(std::string_view name) const {
        return const_cast<headers*>(this)->find(name);
    }

    std::vector<field> fields_;
};

/// Percent-decode a URL path; '+' stays a plus sign
inline std::string url_decode_path(std::string_view path) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = detail::ascii_lower(c);
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    std::string out;
    out.reserve(path.size());
    size_t i = 0;
    while (i < path.size()) {
        if (path[i] == '%' && i + 2 < path.size()) {
            int hi = hex(path[i + 1]);
            int lo = hex(path[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 3;
                continue;
            }
        }
        out.push_back(path[i++]);
    }
    return out;
}

namespace mime {

inline constexpr std::string_view text_plain = "text/plain";
inline constexpr std::string_view text_html = "text/html";
inline constexpr std::string_view application_json = "application/json";
inline constexpr std::string_view application_json_utf8 = "application/json; charset=utf-8";
inline constexpr std::string_view application_octet_stream = "application/octet-stream";
inline constexpr std::string_view image_svg = "image/svg+xml";

/// Content type for a file name, by extension
inline std::string_view from_path(std::string_view path) noexcept {
    constexpr std::pair<std::string_view, std::string_view> by_extension[] = {
        {"html", "text/html; charset=utf-8"},
        {"htm", "text/html; charset=utf-8"},
        {"css", "text/css; charset=utf-8"},
        {"js", "text/javascript; charset=utf-8"},
        {"mjs", "text/javascript; charset=utf-8"},
        {"json", application_json_utf8},
        {"map", application_json_utf8},
        {"txt", "text/plain; charset=utf-8"},
        {"svg", image_svg},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"ico", "image/x-icon"},
        {"woff2", "font/woff2"},
        {"wasm", "application/wasm"},
    };

    auto dot = path.rfind('.');
    auto slash = path.rfind('/');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return application_octet_stream;
    }
    auto ext = path.substr(dot + 1);
    for (const auto& [known, type] : by_extension) {
        if (known == ext) {
            return type;
        }
    }
    return application_octet_stream;
}

} // namespace mime

} // namespace sdkgate::http
