#pragma once

/// @file gateway_server.hpp
/// @brief HTTP front of the RPC gateway
///
/// Terminates HTTP/1.1 connections, serves the built-in introspection,
/// generator and playground routes, and runs every other request through
/// the RPC pipeline: normalize, dispatch, taxonomy, encode.

#include <sdkgate/server/config.hpp>
#include <sdkgate/http/http_common.hpp>
#include <sdkgate/http/http_message.hpp>
#include <sdkgate/http/http_parser.hpp>
#include <sdkgate/http/router.hpp>
#include <sdkgate/http/header_policy.hpp>
#include <sdkgate/http/static_files.hpp>
#include <sdkgate/codegen/generator.hpp>
#include <sdkgate/rpc/api.hpp>
#include <sdkgate/rpc/dispatcher.hpp>
#include <sdkgate/rpc/normalizer.hpp>
#include <sdkgate/rpc/response_encoder.hpp>
#include <sdkgate/rpc/taxonomy.hpp>
#include <sdkgate/util/client_ip.hpp>
#include <sdkgate/net/tcp.hpp>
#include <sdkgate/runtime/event_loop.hpp>
#include <sdkgate/coro/task.hpp>
#include <sdkgate/log/macros.hpp>

#include <chrono>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace sdkgate::server {

/// RPC gateway server
class gateway_server {
public:
    using clock = std::chrono::steady_clock;

    gateway_server(rpc::api_config api, gateway_config config = {})
        : config_(std::move(config))
        , dispatcher_(std::move(api))
        , headers_(http::header_policy::with_cors_defaults())
        , playground_(config_.playground_root)
        , ids_(rpc::default_id_generator()) {
        register_builtin_routes();
    }

    gateway_server(const gateway_server&) = delete;
    gateway_server& operator=(const gateway_server&) = delete;

    const gateway_config& config() const noexcept { return config_; }
    const http::route_table& routes() const noexcept { return routes_; }
    const http::header_policy& policy() const noexcept { return headers_; }

    /// Register an extra HTTP route; the handler owns the whole response
    void add_http_handler(http::method m, http::route_matcher matcher, http::handler_func handler) {
        routes_.add(m, std::move(matcher), std::move(handler));
    }

    void add_http_handler(http::method m, http::route_matcher matcher, http::sync_handler_func handler) {
        routes_.add(m, std::move(matcher), std::move(handler));
    }

    /// Add a header to every response; repeated names are comma-joined
    void add_header(std::string_view name, std::string_view value) {
        headers_.add_header(name, value);
    }

    /// Install the generator behind one of the /targets/ paths
    void set_generator(std::string_view path, codegen::generator gen) {
        targets_.set(path, std::move(gen));
    }

    /// Strip this prefix from request paths before routing
    void ignore_url_prefix(std::string prefix) {
        config_.ignored_url_prefix = std::move(prefix);
    }

    /// Replace the source of generated request and device ids
    void set_id_generator(rpc::id_generator ids) {
        ids_ = std::move(ids);
    }

    /// Run one request through the pipeline
    ///
    /// Never throws for request-level failures: whatever goes wrong is
    /// answered with an envelope.
    /// @param peer Socket peer host, used when no proxy header names the client
    /// @param start When the first byte of the request arrived
    coro::task<http::response> handle(const http::request& req, std::string_view peer,
                                      clock::time_point start = clock::now()) {
        http::response resp;
        std::exception_ptr failure;

        try {
            resp = co_await route(req, peer, start);
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            auto reply = rpc::reply_from_exception(failure, "request pipeline");
            resp = encoder_.encode_fallback(reply.error());
        }

        apply_headers(resp, req);
        co_return resp;
    }

    /// Accept connections on the current event loop until stop()
    /// @throws std::system_error if the address cannot be bound
    coro::task<void> listen(const net::ipv4_address& addr, const net::tcp_options& opts = {}) {
        auto& ctx = runtime::current_io_context();

        auto bound = net::tcp_listener::bind(addr, ctx, opts);
        if (!bound) {
            SDKGATE_LOG_ERROR("Failed to bind {}: {}", addr.to_string(), strerror(bound.error()));
            throw std::system_error(bound.error(), std::system_category(), "bind " + addr.to_string());
        }

        listener_.emplace(std::move(*bound));
        running_ = true;

        SDKGATE_LOG_INFO("Listening on {}", listener_->local_address().to_string());

        while (running_) {
            auto stream = co_await listener_->accept();
            if (!stream) {
                if (!running_ || stream.error() == ECANCELED || stream.error() == EBADF) {
                    break;
                }
                SDKGATE_LOG_ERROR("Accept error: {}", strerror(stream.error()));
                continue;
            }

            handle_connection(std::move(*stream)).go();
        }

        running_ = false;
        listener_.reset();
    }

    /// Stop accepting; a pending accept is cancelled
    void stop() {
        running_ = false;
        if (listener_) {
            listener_->close();
        }
    }

    bool is_running() const noexcept { return running_; }

    /// Bound address while listening
    std::optional<net::ipv4_address> local_address() const {
        if (!listener_) {
            return std::nullopt;
        }
        return listener_->local_address();
    }

private:
    void register_builtin_routes() {
        for (auto target : codegen::target_paths) {
            std::string path(target);
            routes_.add(http::method::GET, path,
                http::sync_handler_func([this, path](const http::request&) {
                    return targets_.render(path, api_schema().description());
                }));
        }

        routes_.add(http::method::GET, http::route_matcher::pattern("^/playground"),
            http::sync_handler_func([this](const http::request& req) {
                return playground_.serve(req, playground_path(req.path()));
            }));

        routes_.add(http::method::GET, "/ast.json",
            http::sync_handler_func([this](const http::request&) {
                return http::response(http::status::ok, api_schema().description().dump(),
                                      http::mime::application_json);
            }));
    }

    const schema::schema& api_schema() const {
        return *dispatcher_.config().schema;
    }

    /// Map a /playground URL onto the bundle directory
    static std::string playground_path(std::string_view path) {
        static constexpr std::string_view mount = "/playground";
        std::string rel(path);
        if (rel.ends_with(mount)) {
            rel.replace(rel.find(mount), mount.size(), "/index.html");
        } else if (auto pos = rel.find(mount); pos != std::string::npos) {
            rel.erase(pos, mount.size());
        }
        if (rel.empty()) {
            rel = "/";
        }
        return rel;
    }

    std::string strip_prefix(std::string_view path) const {
        const auto& prefix = config_.ignored_url_prefix;
        if (!prefix.empty() && path.starts_with(prefix)) {
            path.remove_prefix(prefix.size());
        }
        if (path.empty()) {
            return "/";
        }
        return std::string(path);
    }

    /// Policy headers, then the echoed origin; headers a handler set win
    void apply_headers(http::response& resp, const http::request& req) const {
        headers_.apply(resp, req.get_method() == http::method::OPTIONS, false);

        if (config_.dynamic_cors_origin) {
            auto origin = req.header("Origin");
            if (!origin.empty() && !resp.has_header("Access-Control-Allow-Origin")) {
                resp.set_header("Access-Control-Allow-Origin", origin);
                resp.set_header("Vary", "Origin");
            }
        }
    }

    coro::task<http::response> route(const http::request& req, std::string_view peer,
                                     clock::time_point start) {
        if (req.get_method() == http::method::OPTIONS) {
            co_return http::response(http::status::ok);
        }

        auto path = strip_prefix(req.path());

        if (const auto* entry = routes_.resolve(req.get_method(), path)) {
            if (config_.enable_logging) {
                SDKGATE_LOG_INFO("HTTP {} {}", http::method_to_string(req.get_method()), path);
            }
            if (path == req.path()) {
                co_return co_await entry->handler(req);
            }
            http::request routed = req;
            routed.set_path(path);
            co_return co_await entry->handler(routed);
        }

        co_return co_await handle_rpc(req, peer, start);
    }

    coro::task<http::response> handle_rpc(const http::request& req, std::string_view peer,
                                          clock::time_point start) {
        switch (req.get_method()) {
            case http::method::HEAD: {
                http::response resp(http::status::ok);
                resp.set_content_type(http::mime::application_json_utf8);
                co_return resp;
            }
            case http::method::GET:
                co_return co_await health_check();
            case http::method::POST:
                break;
            default: {
                http::response resp(http::status::bad_request);
                resp.set_content_type(http::mime::application_json_utf8);
                co_return resp;
            }
        }

        auto ip = util::client_ip(req.get_headers(), peer);
        if (!ip) {
            co_return encoder_.encode_fallback(
                rpc::reply_error{std::string(rpc::fatal_type), "Couldn't determine client IP"});
        }

        std::optional<rpc::canonical_request> ctx;
        try {
            ctx.emplace(rpc::parse_request(req.body(), std::move(*ip), req.get_headers(), ids_));
        } catch (const rpc::parse_error& e) {
            SDKGATE_LOG_DEBUG("Rejected request from {}: {}", peer, e.what());
            co_return encoder_.encode_fallback(rpc::reply_error{e.type(), std::string(e.message())});
        }

        auto reply = co_await dispatcher_.dispatch(*ctx);
        reply = rpc::enforce_taxonomy(api_schema(), ctx->call_name, std::move(reply));

        double seconds = std::chrono::duration<double>(clock::now() - start).count();
        auto resp = encoder_.encode(&*ctx, reply, seconds);

        if (config_.enable_logging) {
            std::string_view outcome = reply.ok() ? std::string_view("OK")
                                                  : std::string_view(reply.error().type);
            SDKGATE_LOG_INFO("{} [{:.6f}s] {}() -> {}", ctx->request_id, seconds, ctx->call_name, outcome);
        }
        co_return resp;
    }

    /// GET on the RPC root; a failing hook reports unhealthy
    coro::task<http::response> health_check() {
        bool healthy = false;
        try {
            healthy = co_await dispatcher_.config().hooks->on_health_check();
        } catch (const std::exception& e) {
            SDKGATE_LOG_ERROR("Health check failed: {}", e.what());
        } catch (...) {
            SDKGATE_LOG_ERROR("Health check failed: unknown exception");
        }

        co_return http::response::json(healthy ? http::status::ok : http::status::internal_server_error,
                                       json{{"ok", healthy}}.dump());
    }

    /// Detached per-connection task; never lets an exception escape
    coro::task<void> handle_connection(net::tcp_stream stream) {
        auto peer = stream.peer_address();
        std::string peer_host = peer ? peer->host() : std::string();

        SDKGATE_LOG_DEBUG("Connection from {}", peer ? peer->to_string() : "unknown");

        try {
            co_await handle_requests(stream, peer_host);
        } catch (const std::exception& e) {
            SDKGATE_LOG_ERROR("Connection from {} failed: {}", peer_host, e.what());
        }

        SDKGATE_LOG_DEBUG("Connection closed: {}", peer_host);
    }

    /// Keep-alive request loop of one connection
    coro::task<void> handle_requests(net::tcp_stream& stream, const std::string& peer_host) {
        std::vector<char> buffer(config_.read_buffer_size);
        http::request_parser parser(config_.max_request_size);
        size_t request_count = 0;

        while (running_ && request_count < config_.max_keep_alive_requests) {
            parser.reset();
            std::optional<clock::time_point> start;

            // Pipelined bytes left over from the previous request
            if (parser.has_buffered()) {
                start = clock::now();
                parser.parse({});
            }

            while (!parser.is_complete() && !parser.has_error()) {
                auto result = co_await stream.read(buffer.data(), buffer.size());
                if (result.result <= 0) {
                    co_return;
                }
                if (!start) {
                    start = clock::now();
                }
                parser.parse(std::string_view(buffer.data(), static_cast<size_t>(result.result)));
            }

            if (parser.has_error()) {
                SDKGATE_LOG_DEBUG("Malformed request from {}: {}", peer_host, parser.error_message());
                auto resp = parser.body_too_large()
                    ? http::response(http::status::payload_too_large, std::string(parser.error_message()))
                    : http::response::bad_request(std::string(parser.error_message()));
                resp.set_header("Connection", "close");
                co_await send_response(stream, resp, false);
                co_return;
            }

            auto req = http::request::from_parser(parser);
            ++request_count;

            auto resp = co_await handle(req, peer_host, *start);

            bool keep_alive = req.get_headers().keep_alive(req.version())
                              && request_count < config_.max_keep_alive_requests
                              && running_;
            if (!keep_alive) {
                resp.set_header("Connection", "close");
            }

            if (!co_await send_response(stream, resp, req.get_method() == http::method::HEAD)) {
                co_return;
            }
            if (!keep_alive) {
                co_return;
            }
        }
    }

    /// Write a whole response; false when the peer is gone
    static coro::task<bool> send_response(net::tcp_stream& stream, const http::response& resp,
                                          bool head_only) {
        auto data = resp.serialize(head_only);

        size_t sent = 0;
        while (sent < data.size()) {
            auto result = co_await stream.write(data.data() + sent, data.size() - sent);
            if (result.result <= 0) {
                co_return false;
            }
            sent += static_cast<size_t>(result.result);
        }
        co_return true;
    }

    gateway_config config_;
    rpc::dispatcher dispatcher_;
    http::route_table routes_;
    http::header_policy headers_;
    codegen::target_registry targets_;
    http::static_files playground_;
    rpc::response_encoder encoder_;
    rpc::id_generator ids_;
    std::optional<net::tcp_listener> listener_;
    bool running_ = false;
};

} // namespace sdkgate::server
