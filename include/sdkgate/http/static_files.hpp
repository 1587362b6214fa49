#pragma once

#include <sdkgate/http/http_common.hpp>
#include <sdkgate/http/http_message.hpp>
#include <sdkgate/log/macros.hpp>

#include <openssl/sha.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace sdkgate::http {

/// Strong entity tag for a body: quoted hex SHA-1
inline std::string compute_etag(std::string_view content) {
    std::array<uint8_t, SHA_DIGEST_LENGTH> hash;
    SHA1(reinterpret_cast<const uint8_t*>(content.data()), content.size(), hash.data());

    static const char digits[] = "0123456789abcdef";
    std::string etag = "\"";
    for (auto byte : hash) {
        etag += digits[byte >> 4];
        etag += digits[byte & 0x0F];
    }
    etag += '"';
    return etag;
}

/// Read-only file server over one directory tree
///
/// No directory listings; a directory is served through its index.html.
class static_files {
public:
    explicit static_files(std::filesystem::path root)
        : root_(std::move(root)) {}

    const std::filesystem::path& root() const noexcept { return root_; }

    /// Serve a request path relative to the root
    response serve(const request& req, std::string_view url_path) const {
        auto decoded = url_decode_path(url_path);

        if (decoded.find('\0') != std::string::npos || has_parent_segment(decoded)) {
            return response(status::forbidden, "Forbidden", mime::text_plain);
        }

        std::string_view relative = decoded;
        while (!relative.empty() && relative.front() == '/') {
            relative.remove_prefix(1);
        }

        std::error_code ec;
        auto target = root_ / std::filesystem::path(relative);
        if (std::filesystem::is_directory(target, ec)) {
            target /= "index.html";
        }
        if (!std::filesystem::is_regular_file(target, ec)) {
            return response::not_found();
        }

        std::ifstream file(target, std::ios::binary);
        if (!file) {
            SDKGATE_LOG_WARNING("Cannot open static file {}", target.string());
            return response::not_found();
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            SDKGATE_LOG_ERROR("Failed reading static file {}", target.string());
            return response::internal_error();
        }

        auto etag = compute_etag(content);
        if (matches_etag(req.header("If-None-Match"), etag)) {
            response resp(status::not_modified);
            resp.set_header("ETag", etag);
            return resp;
        }

        response resp(status::ok, std::move(content), mime::from_path(target.filename().string()));
        resp.set_header("ETag", etag);
        return resp;
    }

private:
    static bool has_parent_segment(std::string_view path) {
        size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find_first_of("/\\", start);
            if (end == std::string_view::npos) end = path.size();
            if (path.substr(start, end - start) == "..") {
                return true;
            }
            start = end + 1;
        }
        return false;
    }

    static bool matches_etag(std::string_view header, std::string_view etag) {
        if (header.empty()) return false;
        while (!header.empty()) {
            auto comma = header.find(',');
            auto candidate = trim(header.substr(0, comma));
            if (candidate.starts_with("W/")) candidate.remove_prefix(2);
            if (candidate == "*" || candidate == etag) return true;
            if (comma == std::string_view::npos) break;
            header.remove_prefix(comma + 1);
        }
        return false;
    }

    std::filesystem::path root_;
};

} // namespace sdkgate::http
