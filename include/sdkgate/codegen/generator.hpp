#pragma once

#include <sdkgate/schema/schema.hpp>
#include <sdkgate/http/http_message.hpp>
#include <sdkgate/log/macros.hpp>

#include <array>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sdkgate::codegen {

/// Produces client or server stub source for one target platform
using generator = std::function<std::string(const json& ast)>;

/// Paths the gateway serves generated sources on
inline constexpr std::array<std::string_view, 4> target_paths = {
    "/targets/node/api.ts",
    "/targets/node/client.ts",
    "/targets/web/client.ts",
    "/targets/flutter/client.dart",
};

inline bool is_target_path(std::string_view path) {
    for (auto target : target_paths) {
        if (target == path) return true;
    }
    return false;
}

/// Generators keyed by target path
class target_registry {
public:
    /// Register or replace the generator for a target
    /// @throws std::invalid_argument for a path that is not a target
    void set(std::string_view path, generator gen) {
        if (!is_target_path(path)) {
            throw std::invalid_argument("not a generator target: " + std::string(path));
        }
        generators_[std::string(path)] = std::move(gen);
    }

    const generator* find(std::string_view path) const {
        auto it = generators_.find(path);
        if (it == generators_.end() || !it->second) {
            return nullptr;
        }
        return &it->second;
    }

    /// Run a target's generator; any failure becomes a 500 carrying the error text
    http::response render(std::string_view path, const json& ast) const {
        const auto* gen = find(path);
        if (!gen) {
            return http::response(http::status::internal_server_error,
                                  "No generator registered for " + std::string(path),
                                  http::mime::application_octet_stream);
        }

        try {
            return http::response(http::status::ok, (*gen)(ast), http::mime::application_octet_stream);
        } catch (const std::exception& e) {
            SDKGATE_LOG_ERROR("Generator for {} failed: {}", path, e.what());
            return http::response(http::status::internal_server_error, e.what(),
                                  http::mime::application_octet_stream);
        }
    }

private:
    std::map<std::string, generator, std::less<>> generators_;
};

} // namespace sdkgate::codegen
