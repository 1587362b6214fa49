/// @file gateway_server.cpp
/// @brief RPC Gateway Example
///
/// Serves a small demo API described by an AST file, with the playground
/// bundle and a TypeScript stub generator.
///
/// Usage: ./sdkgate_server [port] [--ast file] [--prefix p] [--static-cors]
///                         [--playground dir] [--debug]
/// Default: port 8000 (or SDKGATE_PORT), ast.json in the working directory

#include <sdkgate/sdkgate.hpp>

#include <fmt/ranges.h>

#include <csignal>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace sdkgate;

namespace {

struct user_record {
    std::string name;
    std::string email;
};

// In-memory demo data, keyed by lower-case uuid
const std::map<std::string, user_record, std::less<>> users = {
    {"6f1c1e1e-9c3a-4c8f-9a55-2b0f3a4c5d6e", {"Ada", "ada@example.com"}},
    {"0b7e5f3a-1d2c-4e6f-8a9b-c0d1e2f3a4b5", {"Grace", "grace@example.com"}},
};

rpc::function_table demo_functions() {
    rpc::function_table fns;

    fns["ping"] = [](const rpc::canonical_request&, json) -> coro::task<json> {
        co_return true;
    };

    fns["echo"] = [](const rpc::canonical_request&, json args) -> coro::task<json> {
        co_return args["message"];
    };

    fns["add"] = [](const rpc::canonical_request&, json args) -> coro::task<json> {
        co_return args["a"].get<int64_t>() + args["b"].get<int64_t>();
    };

    fns["getUser"] = [](const rpc::canonical_request&, json args) -> coro::task<json> {
        auto id = args["id"].get<std::string>();
        auto it = users.find(id);
        if (it == users.end()) {
            throw rpc::rpc_error("NotFound", "No user with id " + id);
        }
        co_return json{{"id", id}, {"name", it->second.name}, {"email", it->second.email}};
    };

    fns["whoami"] = [](const rpc::canonical_request& ctx, json) -> coro::task<json> {
        co_return json{
            {"deviceId", ctx.device.id},
            {"ip", ctx.source_ip},
            {"type", ctx.device.type},
            {"version", rpc::to_int(ctx.version())},
        };
    };

    return fns;
}

// Lists the calls as a TypeScript interface; enough to exercise the target route
std::string node_api_stub(const json& ast) {
    std::string out = "export interface Api {\n";
    for (const auto& [name, fn] : ast["functionTable"].items()) {
        std::vector<std::string> params;
        for (const auto& [arg, type] : fn["args"].items()) {
            params.push_back(arg + ": " + type.dump());
        }
        out += fmt::format("    {}(args: {{ {} }}): Promise<unknown>;\n", name, fmt::join(params, "; "));
    }
    out += "}\n";
    return out;
}

coro::task<void> watch_signals(signal::signal_fd& sigfd, server::gateway_server& srv) {
    auto info = co_await sigfd.wait();
    if (!info) {
        co_return;
    }
    SDKGATE_LOG_INFO("Received {}, shutting down", info->full_name());
    srv.stop();
}

coro::task<void> serve(server::gateway_server& srv, signal::signal_fd& sigfd) {
    watch_signals(sigfd, srv).go();
    co_await srv.listen(net::ipv4_address(srv.config().bind_address, srv.config().port));
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    server::launch_options opts;
    try {
        opts = server::parse_launch_options(std::span<const std::string_view>(args),
                                            server::port_from_env());
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        fmt::print(stderr, "Usage: {} [port] [--ast file] [--prefix p] [--static-cors] "
                           "[--playground dir] [--debug]\n", argv[0]);
        return 2;
    }

    if (opts.debug) {
        log::logger::instance().set_level(log::level::debug);
    }

    rpc::api_config api;
    try {
        api.schema = schema::ast_schema::from_file(opts.ast_path);
    } catch (const schema::schema_error& e) {
        SDKGATE_LOG_ERROR("{}", e.what());
        return 1;
    }
    api.functions = demo_functions();

    SDKGATE_LOG_INFO("sdkgate {} serving {} calls from {}", version(),
                     api.schema->description().at("functionTable").size(), opts.ast_path);

    server::gateway_server srv(std::move(api), opts.config);
    srv.set_generator("/targets/node/api.ts", node_api_stub);

    runtime::event_loop loop;
    signal::signal_fd sigfd(signal::signal_set{SIGINT, SIGTERM}, loop.io_context());

    try {
        loop.run(serve(srv, sigfd));
    } catch (const std::exception& e) {
        SDKGATE_LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }

    SDKGATE_LOG_INFO("Server stopped");
    return 0;
}
