#pragma once

#include <sdkgate/rpc/context.hpp>
#include <sdkgate/schema/schema.hpp>
#include <sdkgate/coro/task.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace sdkgate::rpc {

/// Pre-call hook outcome: continue with the call
struct proceed {};

/// Pre-call hook outcome: answer with this reply, skipping the call
struct short_circuit {
    canonical_reply reply;
};

using hook_decision = std::variant<proceed, short_circuit>;

/// Caller-supplied lifecycle hooks
///
/// Defaults are healthy, always proceed and never replace a reply.
/// Hooks may throw; the gateway converts failures into error replies.
class hooks {
public:
    virtual ~hooks() = default;

    /// Backs GET on the RPC root
    virtual coro::task<bool> on_health_check() {
        co_return true;
    }

    /// Runs before argument decoding; used for authentication or rate limiting
    virtual coro::task<hook_decision> on_request_start(const canonical_request& ctx) {
        (void)ctx;
        co_return hook_decision{proceed{}};
    }

    /// Sees the reply before taxonomy enforcement; a value replaces it
    virtual coro::task<std::optional<canonical_reply>> on_request_end(const canonical_request& ctx,
                                                                      const canonical_reply& reply) {
        (void)ctx;
        (void)reply;
        co_return std::optional<canonical_reply>{};
    }
};

/// Implementation of one call: receives the context and decoded arguments,
/// returns the value to be encoded against the declared return type
using call_impl = std::function<coro::task<json>(const canonical_request&, json)>;

/// Call name -> implementation
using function_table = std::map<std::string, call_impl, std::less<>>;

/// Everything the gateway needs to serve one API
struct api_config {
    std::shared_ptr<const sdkgate::schema::schema> schema;
    function_table functions;
    std::shared_ptr<rpc::hooks> hooks = std::make_shared<rpc::hooks>();
};

} // namespace sdkgate::rpc
