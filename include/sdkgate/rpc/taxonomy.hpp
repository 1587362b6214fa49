#pragma once

#include <sdkgate/rpc/context.hpp>
#include <sdkgate/rpc/error.hpp>
#include <sdkgate/schema/schema.hpp>

#include <string_view>

namespace sdkgate::rpc {

/// Rewrite error types the call does not declare to Fatal
///
/// Calls without throws annotations are unrestricted. The message is
/// always preserved.
inline canonical_reply enforce_taxonomy(const schema::schema& s, std::string_view call_name,
                                        canonical_reply reply) {
    if (reply.ok()) {
        return reply;
    }

    const auto* call = s.lookup_call(call_name);
    if (!call || call->declared_errors.empty()) {
        return reply;
    }

    if (!call->declares(reply.error().type)) {
        reply.error().type = fatal_type;
    }
    return reply;
}

} // namespace sdkgate::rpc
