#pragma once

#include <sdkgate/http/http_common.hpp>

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace sdkgate::http {

enum class parse_result {
    need_more,
    complete,
    error
};

/// Incremental HTTP/1.1 request parser
///
/// Input accumulates in one buffer with a read cursor. The head is parsed
/// once the blank line arrives; the body is buffered in full, whether
/// framed by Content-Length or chunked. Consumed bytes are dropped after
/// every call. Bytes after a complete request stay buffered, so after
/// reset() a pipelined request is picked up with parse({}).
///
/// Blank lines before the request line, each framing line, and the trailer
/// section are held to the header size limit.
class request_parser {
public:
    static constexpr size_t default_max_header_size = 64 * 1024;

    request_parser() = default;

    explicit request_parser(size_t max_body_size,
                            size_t max_header_size = default_max_header_size)
        : max_body_(max_body_size), max_head_(max_header_size) {}

    /// Forget the current request; unread bytes are kept
    void reset() {
        compact();
        phase_ = phase::head;
        method_ = method::GET;
        path_.clear();
        query_.clear();
        version_.clear();
        headers_.clear();
        body_.clear();
        expected_ = 0;
        chunk_left_ = 0;
        skipped_ = 0;
        trailer_size_ = 0;
        too_large_ = false;
        error_.clear();
    }

    /// Append bytes and advance as far as they allow
    parse_result parse(std::string_view data) {
        pending_.append(data);
        while (phase_ != phase::done && phase_ != phase::failed) {
            if (!step()) {
                break;
            }
        }
        compact();
        switch (phase_) {
            case phase::done:   return parse_result::complete;
            case phase::failed: return parse_result::error;
            default:            return parse_result::need_more;
        }
    }

    method get_method() const noexcept { return method_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query() const noexcept { return query_; }
    std::string_view version() const noexcept { return version_; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    std::string_view body() const noexcept { return body_; }
    std::string take_body() { return std::move(body_); }

    std::string_view error_message() const noexcept { return error_; }

    bool is_complete() const noexcept { return phase_ == phase::done; }
    bool has_error() const noexcept { return phase_ == phase::failed; }

    /// The failure was a body over the size limit
    bool body_too_large() const noexcept { return too_large_; }

    /// Unread bytes are waiting in the buffer
    bool has_buffered() const noexcept { return cursor_ < pending_.size(); }

    /// Some part of the current request has arrived
    bool started() const noexcept { return phase_ != phase::head || has_buffered(); }

private:
    enum class phase { head, sized_body, chunk_header, chunk_body, trailers, done, failed };

    std::string_view unread() const noexcept {
        return std::string_view(pending_).substr(cursor_);
    }

    void compact() {
        pending_.erase(0, cursor_);
        cursor_ = 0;
    }

    /// Next CRLF-terminated line, consumed; nullopt until one is complete
    /// or once the partial line outgrows the header limit (then failed)
    std::optional<std::string_view> take_line() {
        auto rest = unread();
        auto eol = rest.find("\r\n");
        if (eol == std::string_view::npos) {
            if (rest.size() > max_head_) {
                fail("Request header section too large");
            }
            return std::nullopt;
        }
        cursor_ += eol + 2;
        return rest.substr(0, eol);
    }

    bool fail(std::string_view message, bool too_large = false) {
        phase_ = phase::failed;
        error_ = message;
        too_large_ = too_large;
        return false;
    }

    /// One unit of progress; false when stalled or finished
    bool step() {
        switch (phase_) {
            case phase::head:         return read_head();
            case phase::sized_body:   return read_sized_body();
            case phase::chunk_header: return read_chunk_header();
            case phase::chunk_body:   return read_chunk_body();
            case phase::trailers:     return read_trailers();
            default:                  return false;
        }
    }

    bool read_head() {
        // Empty lines before a request line are tolerated
        while (unread().starts_with("\r\n")) {
            cursor_ += 2;
            skipped_ += 2;
            if (skipped_ > max_head_) {
                return fail("Request header section too large");
            }
        }

        auto rest = unread();
        auto blank = rest.find("\r\n\r\n");
        if (blank == std::string_view::npos) {
            if (rest.size() > max_head_) {
                return fail("Request header section too large");
            }
            return false;
        }
        if (blank > max_head_) {
            return fail("Request header section too large");
        }

        auto head = rest.substr(0, blank + 2);
        cursor_ += blank + 4;

        auto eol = head.find("\r\n");
        if (!parse_request_line(head.substr(0, eol))) {
            return false;
        }
        for (head.remove_prefix(eol + 2); !head.empty(); ) {
            eol = head.find("\r\n");
            auto line = head.substr(0, eol);
            head.remove_prefix(eol + 2);

            auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                return fail("Invalid header line");
            }
            headers_.add(line.substr(0, colon), trim(line.substr(colon + 1)));
        }
        return choose_framing();
    }

    bool parse_request_line(std::string_view line) {
        auto first_space = line.find(' ');
        if (first_space == std::string_view::npos) {
            return fail("Invalid request line: no method");
        }
        auto m = string_to_method(line.substr(0, first_space));
        if (!m) {
            return fail("Unknown HTTP method");
        }

        auto target = line.substr(first_space + 1);
        auto second_space = target.find(' ');
        if (second_space == std::string_view::npos) {
            return fail("Invalid request line: no version");
        }
        auto version = target.substr(second_space + 1);
        target = target.substr(0, second_space);
        if (target.empty()) {
            return fail("Invalid request line: empty target");
        }
        if (!version.starts_with("HTTP/")) {
            return fail("Invalid HTTP version");
        }

        method_ = *m;
        version_ = version;
        auto question = target.find('?');
        path_ = target.substr(0, question);
        if (question != std::string_view::npos) {
            query_ = target.substr(question + 1);
        }
        return true;
    }

    bool choose_framing() {
        if (headers_.is_chunked()) {
            phase_ = phase::chunk_header;
            return true;
        }
        if (!headers_.contains("Content-Length")) {
            phase_ = phase::done;
            return false;
        }

        auto length = headers_.content_length();
        if (!length) {
            return fail("Invalid Content-Length");
        }
        if (*length > max_body_) {
            return fail("Request body too large", true);
        }
        expected_ = *length;
        if (expected_ == 0) {
            phase_ = phase::done;
            return false;
        }
        body_.reserve(expected_);
        phase_ = phase::sized_body;
        return true;
    }

    bool read_sized_body() {
        auto chunk = unread().substr(0, expected_ - body_.size());
        body_.append(chunk);
        cursor_ += chunk.size();
        if (body_.size() < expected_) {
            return false;
        }
        phase_ = phase::done;
        return false;
    }

    bool read_chunk_header() {
        auto line = take_line();
        if (!line) {
            return false;
        }
        auto size_text = trim(line->substr(0, line->find(';')));

        size_t size = 0;
        const char* end = size_text.data() + size_text.size();
        auto [ptr, ec] = std::from_chars(size_text.data(), end, size, 16);
        if (size_text.empty() || ec != std::errc{} || ptr != end) {
            return fail("Invalid chunk size");
        }
        if (size > max_body_ - body_.size()) {
            return fail("Request body too large", true);
        }

        chunk_left_ = size;
        phase_ = size == 0 ? phase::trailers : phase::chunk_body;
        return true;
    }

    bool read_chunk_body() {
        auto rest = unread();
        if (rest.size() < chunk_left_ + 2) {
            return false;
        }
        if (rest.substr(chunk_left_, 2) != "\r\n") {
            return fail("Malformed chunk terminator");
        }
        body_.append(rest.substr(0, chunk_left_));
        cursor_ += chunk_left_ + 2;
        phase_ = phase::chunk_header;
        return true;
    }

    /// Trailer fields are read and discarded up to the blank line
    bool read_trailers() {
        while (auto line = take_line()) {
            if (line->empty()) {
                phase_ = phase::done;
                return false;
            }
            trailer_size_ += line->size() + 2;
            if (trailer_size_ > max_head_) {
                return fail("Request header section too large");
            }
        }
        return false;
    }

    std::string pending_;
    size_t cursor_ = 0;
    phase phase_ = phase::head;

    method method_ = method::GET;
    std::string path_;
    std::string query_;
    std::string version_;
    headers headers_;
    std::string body_;

    size_t expected_ = 0;
    size_t chunk_left_ = 0;
    size_t skipped_ = 0;
    size_t trailer_size_ = 0;
    size_t max_body_ = std::numeric_limits<size_t>::max();
    size_t max_head_ = default_max_header_size;
    bool too_large_ = false;
    std::string error_;
};

} // namespace sdkgate::http
