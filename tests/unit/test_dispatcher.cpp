#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sdkgate/rpc/dispatcher.hpp>
#include <sdkgate/rpc/taxonomy.hpp>
#include "../test_main.cpp"

#include <vector>

using namespace sdkgate;
using namespace sdkgate::rpc;
using namespace sdkgate::coro;
using namespace sdkgate::test;
using Catch::Matchers::ContainsSubstring;

namespace {

canonical_request v3_request(std::string name, json args) {
    canonical_request req{v3_extra{}};
    req.request_id = "req-1";
    req.call_name = std::move(name);
    req.raw_args = std::move(args);
    req.device.id = "dev-1";
    req.source_ip = "127.0.0.1";
    return req;
}

function_table test_functions(std::vector<std::string>* calls = nullptr) {
    function_table fns;
    fns["ping"] = [calls](const canonical_request&, json) -> task<json> {
        if (calls) calls->push_back("ping");
        co_return json(true);
    };
    fns["echo"] = [](const canonical_request&, json args) -> task<json> {
        co_return args["message"];
    };
    fns["getUser"] = [](const canonical_request&, json args) -> task<json> {
        if (args["id"] == "00000000-0000-0000-0000-000000000000") {
            throw rpc_error("NotFound", "no such user");
        }
        co_return json{{"id", args["id"]}, {"name", "Ana"}, {"tags", json::array()}};
    };
    fns["fail"] = [](const canonical_request&, json args) -> task<json> {
        throw rpc_error(args["kind"].get<std::string>(), "failed with " + args["kind"].get<std::string>());
        co_return json();
    };
    fns["unrestricted"] = [](const canonical_request&, json args) -> task<json> {
        throw rpc_error(args["kind"].get<std::string>(), "anything goes");
        co_return json();
    };
    fns["broken"] = [](const canonical_request&, json) -> task<json> {
        co_return json("not an int");
    };
    fns["paint"] = [](const canonical_request&, json) -> task<json> {
        throw std::runtime_error("brush lost");
        co_return json();
    };
    return fns;
}

/// Hooks recording their calls, with configurable behavior
class recording_hooks : public hooks {
public:
    std::vector<std::string> events;
    std::optional<canonical_reply> short_reply;
    std::optional<canonical_reply> end_reply;
    bool throw_on_start = false;
    bool throw_on_end = false;

    task<hook_decision> on_request_start(const canonical_request& ctx) override {
        events.push_back("start:" + ctx.call_name);
        if (throw_on_start) {
            throw rpc_error("Unauthorized", "bad token");
        }
        if (short_reply) {
            co_return hook_decision{short_circuit{*short_reply}};
        }
        co_return hook_decision{proceed{}};
    }

    task<std::optional<canonical_reply>> on_request_end(const canonical_request& ctx,
                                                       const canonical_reply& reply) override {
        events.push_back(std::string("end:") + ctx.call_name + (reply.ok() ? ":ok" : ":" + reply.error().type));
        if (throw_on_end) {
            throw std::runtime_error("end hook exploded");
        }
        co_return end_reply;
    }
};

canonical_reply dispatch(const dispatcher& d, canonical_request req) {
    return run(d.dispatch(req));
}

} // namespace

TEST_CASE("dispatcher requires a schema", "[dispatcher]") {
    REQUIRE_THROWS_AS(dispatcher(api_config{}), std::invalid_argument);
}

TEST_CASE("dispatcher decodes, calls and encodes", "[dispatcher]") {
    dispatcher d(api_config{test_schema(), test_functions()});

    SECTION("simple result") {
        auto reply = dispatch(d, v3_request("echo", {{"message", "hello"}}));
        REQUIRE(reply.ok());
        REQUIRE(reply.result() == "hello");
    }

    SECTION("struct result is encoded against the return type") {
        auto reply = dispatch(d, v3_request("getUser", {{"id", "123E4567-E89B-12D3-A456-426614174000"}}));
        REQUIRE(reply.ok());
        REQUIRE(reply.result()["id"] == "123e4567-e89b-12d3-a456-426614174000");
        REQUIRE(reply.result()["nickname"].is_null());
    }

    SECTION("typed error from the implementation") {
        auto reply = dispatch(d, v3_request("getUser", {{"id", "00000000-0000-0000-0000-000000000000"}}));
        REQUIRE_FALSE(reply.ok());
        REQUIRE(reply.error().type == "NotFound");
        REQUIRE(reply.error().message == "no such user");
    }

    SECTION("argument mismatch is Fatal") {
        auto reply = dispatch(d, v3_request("echo", {{"message", 5}}));
        REQUIRE_FALSE(reply.ok());
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "Invalid type at 'echo.args.message', expected string, got 5");
    }

    SECTION("return mismatch is Fatal and logged") {
        log_capture logs(log::level::error);
        auto reply = dispatch(d, v3_request("broken", json::object()));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE_THAT(reply.error().message, ContainsSubstring("'broken.ret'"));
        REQUIRE(logs.contains("broken()"));
    }

    SECTION("unexpected exception is Fatal with its message") {
        log_capture logs(log::level::error);
        auto reply = dispatch(d, v3_request("paint", {{"color", "red"}}));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "brush lost");
        REQUIRE(logs.messages(log::level::error).size() == 1);
        REQUIRE(logs.contains("unexpected exception: brush lost"));
    }
}

TEST_CASE("unknown calls skip every hook", "[dispatcher]") {
    auto h = std::make_shared<recording_hooks>();
    dispatcher d(api_config{test_schema(), test_functions(), h});

    SECTION("not in the schema") {
        auto reply = dispatch(d, v3_request("missing", json::object()));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "Function does not exist: missing");
    }

    SECTION("in the schema without an implementation") {
        auto reply = dispatch(d, v3_request("declaredOnly", json::object()));
        REQUIRE(reply.error().message == "Function does not exist: declaredOnly");
    }

    REQUIRE(h->events.empty());
}

TEST_CASE("hooks wrap the call", "[dispatcher][hooks]") {
    auto h = std::make_shared<recording_hooks>();
    std::vector<std::string> calls;
    dispatcher d(api_config{test_schema(), test_functions(&calls), h});

    SECTION("both hooks run around a successful call") {
        auto reply = dispatch(d, v3_request("ping", json::object()));
        REQUIRE(reply.ok());
        REQUIRE(calls == std::vector<std::string>{"ping"});
        REQUIRE(h->events == std::vector<std::string>{"start:ping", "end:ping:ok"});
    }

    SECTION("short circuit skips the implementation") {
        h->short_reply = canonical_reply::failure("RateLimited", "slow down");
        auto reply = dispatch(d, v3_request("ping", json::object()));
        REQUIRE(calls.empty());
        REQUIRE(reply.error().type == "RateLimited");
        REQUIRE(h->events == std::vector<std::string>{"start:ping", "end:ping:RateLimited"});
    }

    SECTION("short circuit runs before argument decoding") {
        h->short_reply = canonical_reply::success(json("cached"));
        auto reply = dispatch(d, v3_request("echo", {{"message", 5}}));
        REQUIRE(reply.ok());
        REQUIRE(reply.result() == "cached");
    }

    SECTION("throwing start hook becomes the reply") {
        h->throw_on_start = true;
        auto reply = dispatch(d, v3_request("ping", json::object()));
        REQUIRE(calls.empty());
        REQUIRE(reply.error().type == "Unauthorized");
        REQUIRE(h->events.back() == "end:ping:Unauthorized");
    }

    SECTION("end hook replaces the reply") {
        h->end_reply = canonical_reply::success(json(false));
        auto reply = dispatch(d, v3_request("ping", json::object()));
        REQUIRE(reply.ok());
        REQUIRE(reply.result() == false);
    }

    SECTION("throwing end hook becomes a Fatal reply") {
        log_capture logs(log::level::error);
        h->throw_on_end = true;
        auto reply = dispatch(d, v3_request("ping", json::object()));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "end hook exploded");
        REQUIRE(logs.contains("on_request_end"));
    }
}

TEST_CASE("default hooks", "[dispatcher][hooks]") {
    hooks defaults;
    REQUIRE(run(defaults.on_health_check()));

    auto req = v3_request("ping", json::object());
    auto decision = run(defaults.on_request_start(req));
    REQUIRE(std::holds_alternative<proceed>(decision));

    auto reply = canonical_reply::success(json(1));
    REQUIRE_FALSE(run(defaults.on_request_end(req, reply)).has_value());
}

TEST_CASE("taxonomy enforcement", "[taxonomy]") {
    auto api = test_schema();

    SECTION("declared error passes through") {
        auto reply = enforce_taxonomy(*api, "fail", canonical_reply::failure("NotFound", "gone"));
        REQUIRE(reply.error().type == "NotFound");
        REQUIRE(reply.error().message == "gone");
    }

    SECTION("undeclared error becomes Fatal with the same message") {
        auto reply = enforce_taxonomy(*api, "fail", canonical_reply::failure("Other", "nope"));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "nope");
    }

    SECTION("calls without annotations are unrestricted") {
        auto reply = enforce_taxonomy(*api, "unrestricted", canonical_reply::failure("Other", "x"));
        REQUIRE(reply.error().type == "Other");
    }

    SECTION("unknown call is left alone") {
        auto reply = enforce_taxonomy(*api, "missing", canonical_reply::failure("Other", "x"));
        REQUIRE(reply.error().type == "Other");
    }

    SECTION("success is untouched") {
        auto reply = enforce_taxonomy(*api, "fail", canonical_reply::success(json(1)));
        REQUIRE(reply.ok());
        REQUIRE(reply.result() == 1);
    }

    SECTION("end to end through the dispatcher") {
        dispatcher d(api_config{api, test_functions()});
        auto reply = enforce_taxonomy(*api, "fail", dispatch(d, v3_request("fail", {{"kind", "Other"}})));
        REQUIRE(reply.error().type == "Fatal");
        REQUIRE(reply.error().message == "failed with Other");

        auto free_reply = enforce_taxonomy(*api, "unrestricted",
                                           dispatch(d, v3_request("unrestricted", {{"kind", "Other"}})));
        REQUIRE(free_reply.error().type == "Other");
    }
}
