#pragma once

#include <sdkgate/http/http_common.hpp>
#include <sdkgate/http/http_parser.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace sdkgate::http {

/// A complete inbound request
class request {
public:
    request() = default;

    request(method m, std::string_view path) : method_(m), path_(path) {}

    /// Take over a parser's finished request; the body is moved out
    static request from_parser(request_parser& parser) {
        request req(parser.get_method(), parser.path());
        req.query_ = parser.query();
        req.version_ = parser.version();
        req.headers_ = parser.get_headers();
        req.body_ = parser.take_body();
        return req;
    }

    method get_method() const noexcept { return method_; }

    /// Path without the query string
    std::string_view path() const noexcept { return path_; }
    void set_path(std::string_view p) { path_ = p; }

    std::string_view query() const noexcept { return query_; }
    std::string_view version() const noexcept { return version_; }

    std::string path_with_query() const {
        std::string target = path_.empty() ? std::string("/") : path_;
        if (!query_.empty()) {
            target.append("?").append(query_);
        }
        return target;
    }

    const headers& get_headers() const noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }
    void set_header(std::string_view name, std::string_view value) { headers_.set(name, value); }

    std::string_view body() const noexcept { return body_; }
    void set_body(std::string b) { body_ = std::move(b); }

private:
    method method_ = method::GET;
    std::string path_ = "/";
    std::string query_;
    std::string version_ = "HTTP/1.1";
    headers headers_;
    std::string body_;
};

/// An outbound response
///
/// Content-Length is framing, written by serialize() rather than stored.
class response {
public:
    response() = default;

    explicit response(status s) : status_(s) {}

    response(status s, std::string body, std::string_view content_type = mime::text_plain)
        : status_(s), body_(std::move(body)) {
        headers_.set_content_type(content_type);
    }

    static response ok(std::string body = {}, std::string_view content_type = mime::text_plain) {
        return {status::ok, std::move(body), content_type};
    }

    static response json(status s, std::string body) {
        return {s, std::move(body), mime::application_json_utf8};
    }

    static response not_found(std::string body = "Not Found") {
        return {status::not_found, std::move(body)};
    }

    static response bad_request(std::string body = "Bad Request") {
        return {status::bad_request, std::move(body)};
    }

    static response internal_error(std::string body = "Internal Server Error") {
        return {status::internal_server_error, std::move(body)};
    }

    status get_status() const noexcept { return status_; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    std::string_view header(std::string_view name) const { return headers_.get(name); }
    bool has_header(std::string_view name) const { return headers_.contains(name); }
    void set_header(std::string_view name, std::string_view value) { headers_.set(name, value); }

    std::string_view content_type() const { return headers_.content_type(); }
    void set_content_type(std::string_view type) { headers_.set_content_type(type); }

    std::string_view body() const noexcept { return body_; }
    void set_body(std::string b) { body_ = std::move(b); }

    /// Status line, headers and body in HTTP/1.1 form
    /// @param head_only Reply to HEAD: announce the length, send no body
    std::string serialize(bool head_only = false) const {
        auto out = fmt::format("HTTP/1.1 {} {}\r\n{}", static_cast<unsigned>(status_),
                               status_reason(status_), headers_.serialize());
        // 204 and 304 never carry a body, so no length either
        if (status_ != status::no_content && status_ != status::not_modified) {
            out += fmt::format("Content-Length: {}\r\n", body_.size());
        }
        out += "\r\n";
        if (!head_only) {
            out += body_;
        }
        return out;
    }

private:
    status status_ = status::ok;
    headers headers_;
    std::string body_;
};

} // namespace sdkgate::http
