#pragma once

#include <sdkgate/rpc/api.hpp>
#include <sdkgate/rpc/context.hpp>
#include <sdkgate/rpc/error.hpp>
#include <sdkgate/schema/codec.hpp>
#include <sdkgate/coro/task.hpp>
#include <sdkgate/log/macros.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sdkgate::rpc {

/// Convert a caught failure into an error reply
/// @param origin Where the failure was caught, for the log
inline canonical_reply reply_from_exception(std::exception_ptr ep, std::string_view origin) {
    try {
        std::rethrow_exception(ep);
    } catch (const rpc_error& e) {
        SDKGATE_LOG_DEBUG("{}: {}: {}", origin, e.type(), e.what());
        return canonical_reply::failure(e);
    } catch (const schema::codec_error& e) {
        SDKGATE_LOG_ERROR("{}: {}", origin, e.what());
        return canonical_reply::failure(std::string(e.type()), e.what());
    } catch (const std::exception& e) {
        SDKGATE_LOG_ERROR("{}: unexpected exception: {}", origin, e.what());
        return canonical_reply::failure(std::string(fatal_type), e.what());
    } catch (...) {
        SDKGATE_LOG_ERROR("{}: unknown exception", origin);
        return canonical_reply::failure(std::string(fatal_type), "Unknown error");
    }
}

/// Runs one call against the schema, implementation table and hooks
///
/// Never throws: every failure after the call is resolved becomes an
/// error reply. Unknown calls are answered before any hook runs.
class dispatcher {
public:
    explicit dispatcher(api_config config)
        : config_(std::move(config)) {
        if (!config_.schema) {
            throw std::invalid_argument("dispatcher requires a schema");
        }
        if (!config_.hooks) {
            config_.hooks = std::make_shared<hooks>();
        }
    }

    const api_config& config() const noexcept { return config_; }

    coro::task<canonical_reply> dispatch(const canonical_request& ctx) const {
        const auto* call = config_.schema->lookup_call(ctx.call_name);
        auto impl = config_.functions.find(ctx.call_name);

        if (!call || impl == config_.functions.end() || !impl->second) {
            co_return canonical_reply::failure(std::string(fatal_type),
                                               "Function does not exist: " + ctx.call_name);
        }

        const auto& types = config_.schema->type_table();
        std::optional<canonical_reply> reply;

        try {
            auto decision = co_await config_.hooks->on_request_start(ctx);
            if (auto* sc = std::get_if<short_circuit>(&decision)) {
                reply = std::move(sc->reply);
            } else {
                auto args = schema::decode(types, ctx.call_name + ".args", call->arg_type, ctx.raw_args);
                auto ret = co_await impl->second(ctx, std::move(args));
                reply = canonical_reply::success(
                    schema::encode(types, ctx.call_name + ".ret", call->ret_type, ret));
            }
        } catch (...) {
            reply = reply_from_exception(std::current_exception(), ctx.call_name + "()");
        }

        try {
            auto replacement = co_await config_.hooks->on_request_end(ctx, *reply);
            if (replacement) {
                reply = std::move(*replacement);
            }
        } catch (...) {
            reply = reply_from_exception(std::current_exception(), "on_request_end");
        }

        co_return std::move(*reply);
    }

private:
    api_config config_;
};

} // namespace sdkgate::rpc
