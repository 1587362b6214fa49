#pragma once

/// sdkgate - schema-driven RPC gateway
///
/// Include this file to get the runtime, the HTTP layer and the gateway
/// server in one go.

// Version information
#define SDKGATE_VERSION_MAJOR 0
#define SDKGATE_VERSION_MINOR 1
#define SDKGATE_VERSION_PATCH 0

// Coroutines and runtime
#include "coro/task.hpp"
#include "runtime/event_loop.hpp"

// I/O
#include "io/io_request.hpp"
#include "io/io_context.hpp"
#include "io/io_awaitables.hpp"

// Networking and signals
#include "net/tcp.hpp"
#include "signal/signalfd.hpp"

// HTTP
#include "http/http_common.hpp"
#include "http/http_parser.hpp"
#include "http/http_message.hpp"
#include "http/router.hpp"
#include "http/header_policy.hpp"
#include "http/static_files.hpp"

// Interface description
#include "schema/schema.hpp"
#include "schema/codec.hpp"

// RPC pipeline
#include "rpc/error.hpp"
#include "rpc/context.hpp"
#include "rpc/api.hpp"
#include "rpc/normalizer.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/taxonomy.hpp"
#include "rpc/response_encoder.hpp"
#include "codegen/generator.hpp"

// Server
#include "server/config.hpp"
#include "server/gateway_server.hpp"

// Utilities and logging
#include "util/client_ip.hpp"
#include "util/host.hpp"
#include "util/random_id.hpp"
#include "log/logger.hpp"
#include "log/macros.hpp"

namespace sdkgate {

inline constexpr const char* version() noexcept {
    return "0.1.0";
}

} // namespace sdkgate
