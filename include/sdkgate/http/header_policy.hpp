#pragma once

#include <sdkgate/http/http_common.hpp>
#include <sdkgate/http/http_message.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdkgate::http {

/// Headers merged into every outgoing response
///
/// Built once at startup; names are stored lower-cased and trimmed, in
/// first-insertion order. Repeated add_header() calls for one name are
/// comma-joined and never deduplicated.
class header_policy {
public:
    header_policy() = default;

    /// Policy pre-seeded with the default CORS headers
    static header_policy with_cors_defaults() {
        header_policy policy;
        policy.add_header("Access-Control-Allow-Methods", "DELETE, HEAD, PUT, POST, PATCH, GET, OPTIONS");
        policy.add_header("Access-Control-Allow-Headers", "Content-Type");
        policy.add_header("Access-Control-Max-Age", "86400");
        return policy;
    }

    void add_header(std::string_view name, std::string_view value) {
        auto clean = to_lower(trim(name));
        for (auto& [existing_name, existing_value] : entries_) {
            if (existing_name == clean) {
                existing_value += ", ";
                existing_value += value;
                return;
            }
        }
        entries_.emplace_back(std::move(clean), std::string(value));
    }

    /// Accumulated value for a header, empty if absent
    std::string_view get(std::string_view name) const {
        auto clean = to_lower(trim(name));
        for (const auto& [existing_name, value] : entries_) {
            if (existing_name == clean) return value;
        }
        return {};
    }

    /// Copy the policy into a response
    /// @param preflight Only copy access-control-* headers (OPTIONS)
    /// @param overwrite Replace headers the response already carries
    void apply(response& resp, bool preflight, bool overwrite = true) const {
        for (const auto& [name, value] : entries_) {
            if (preflight && !name.starts_with("access-control-")) {
                continue;
            }
            if (!overwrite && resp.has_header(name)) {
                continue;
            }
            resp.set_header(name, value);
        }
    }

    const std::vector<std::pair<std::string, std::string>>& entries() const noexcept {
        return entries_;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace sdkgate::http
