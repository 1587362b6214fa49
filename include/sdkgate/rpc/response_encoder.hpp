#pragma once

#include <sdkgate/rpc/context.hpp>
#include <sdkgate/rpc/error.hpp>
#include <sdkgate/http/http_message.hpp>
#include <sdkgate/util/host.hpp>

#include <string>
#include <utility>

namespace sdkgate::rpc {

/// Serializes replies into the envelope of the request's protocol version
class response_encoder {
public:
    explicit response_encoder(std::string host = util::host_name())
        : host_(std::move(host)) {}

    const std::string& host() const noexcept { return host_; }

    /// Wire error object; an empty type is reported as Fatal
    static json error_object(const reply_error& error) {
        return json{
            {"message", error.message},
            {"type", error.type.empty() ? std::string(fatal_type) : error.type},
        };
    }

    /// Serialized document; invalid UTF-8 in messages is replaced, not fatal
    static std::string to_wire(const json& doc) {
        return doc.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    /// 200 for success, 500 for Fatal errors, 400 for any other error
    static http::status status_for(const canonical_reply& reply) {
        if (reply.ok()) {
            return http::status::ok;
        }
        const auto& type = reply.error().type;
        return (type.empty() || type == fatal_type) ? http::status::internal_server_error
                                                    : http::status::bad_request;
    }

    /// Encode a reply
    /// @param ctx The request, or nullptr when it could not be built
    /// @param duration_seconds Elapsed time since the request started
    http::response encode(const canonical_request* ctx, const canonical_reply& reply,
                          double duration_seconds) const {
        if (!ctx) {
            return encode_fallback(reply.ok()
                                       ? reply_error{std::string(fatal_type), "Response without context"}
                                       : reply.error());
        }

        const json error = reply.ok() ? json(nullptr) : error_object(reply.error());
        const json result = reply.ok() ? reply.result() : json(nullptr);
        json body;

        switch (ctx->version()) {
            case protocol_version::v1:
                body = {
                    {"deviceId", ctx->device.id},
                    {"duration", duration_seconds},
                    {"error", error},
                    {"host", host_},
                    {"id", ctx->request_id},
                    {"ok", reply.ok()},
                    {"result", result},
                };
                break;

            case protocol_version::v2: {
                const auto* extra = ctx->v2();
                json session = (extra && extra->session_id) ? json(*extra->session_id) : json(nullptr);
                body = {
                    {"deviceId", ctx->device.id},
                    {"error", error},
                    {"ok", reply.ok()},
                    {"requestId", ctx->request_id},
                    {"result", result},
                    {"sessionId", std::move(session)},
                };
                break;
            }

            case protocol_version::v3:
                body = {
                    {"duration", duration_seconds},
                    {"error", error},
                    {"host", host_},
                    {"result", result},
                };
                break;
        }

        auto resp = http::response::json(status_for(reply), to_wire(body));
        if (ctx->version() == protocol_version::v3) {
            resp.set_header("x-request-id", ctx->request_id);
        }
        return resp;
    }

    /// Context-less envelope {error} with status 500
    http::response encode_fallback(const reply_error& error) const {
        json body = {{"error", error_object(error)}};
        return http::response::json(http::status::internal_server_error, to_wire(body));
    }

private:
    std::string host_;
};

} // namespace sdkgate::rpc
