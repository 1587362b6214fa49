#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sdkgate::server {

/// Gateway server configuration
struct gateway_config {
    uint16_t port = 8000;                          ///< Listen port
    std::string bind_address = "0.0.0.0";          ///< Listen address
    std::string ignored_url_prefix;                ///< Stripped from paths before routing
    bool dynamic_cors_origin = true;               ///< Echo Origin with Vary: Origin
    std::string playground_root = "./playground";  ///< Playground bundle directory
    size_t max_request_size = 10 * 1024 * 1024;    ///< Max request body size (10MB)
    size_t read_buffer_size = 8192;                ///< Read buffer size
    size_t max_keep_alive_requests = 100;          ///< Max requests per connection
    bool enable_logging = true;                    ///< Log routed requests and calls
};

/// Parse a TCP port number
/// @throws std::invalid_argument if the text is not a port in 1..65535
inline uint16_t parse_port(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        throw std::invalid_argument("invalid port: " + std::string(text));
    }
    return static_cast<uint16_t>(value);
}

/// Command line of the gateway executable
struct launch_options {
    gateway_config config;
    std::string ast_path = "ast.json";
    bool debug = false;
};

/// Parse `[port] [--ast <file>] [--prefix <p>] [--static-cors] [--playground <dir>] [--debug]`
///
/// @param args Arguments without the program name
/// @param env_port Value of SDKGATE_PORT, if set; a port argument wins over it
/// @throws std::invalid_argument on unknown options or malformed values
inline launch_options parse_launch_options(std::span<const std::string_view> args,
                                           std::optional<std::string_view> env_port = std::nullopt) {
    launch_options opts;
    if (env_port && !env_port->empty()) {
        opts.config.port = parse_port(*env_port);
    }

    auto value_of = [&](size_t& i) -> std::string_view {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + std::string(args[i]));
        }
        return args[++i];
    };

    bool port_seen = false;
    for (size_t i = 0; i < args.size(); ++i) {
        auto arg = args[i];
        if (arg == "--ast") {
            opts.ast_path = value_of(i);
        } else if (arg == "--prefix") {
            opts.config.ignored_url_prefix = value_of(i);
        } else if (arg == "--playground") {
            opts.config.playground_root = value_of(i);
        } else if (arg == "--static-cors") {
            opts.config.dynamic_cors_origin = false;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (!arg.starts_with("--") && !port_seen) {
            opts.config.port = parse_port(arg);
            port_seen = true;
        } else {
            throw std::invalid_argument("unknown argument: " + std::string(arg));
        }
    }
    return opts;
}

/// SDKGATE_PORT from the environment, if set
inline std::optional<std::string_view> port_from_env() {
    if (const char* value = std::getenv("SDKGATE_PORT")) {
        return std::string_view(value);
    }
    return std::nullopt;
}

} // namespace sdkgate::server
