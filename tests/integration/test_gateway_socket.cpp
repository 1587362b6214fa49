#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sdkgate/server/gateway_server.hpp>
#include <sdkgate/net/tcp.hpp>
#include <sdkgate/runtime/event_loop.hpp>
#include "../test_main.cpp"

#include <filesystem>
#include <string>

using namespace sdkgate;
using namespace sdkgate::coro;
using namespace sdkgate::net;
using namespace sdkgate::server;
using namespace sdkgate::test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

rpc::api_config socket_api() {
    rpc::function_table fns;
    fns["ping"] = [](const rpc::canonical_request&, json) -> task<json> {
        co_return json(true);
    };
    fns["echo"] = [](const rpc::canonical_request&, json args) -> task<json> {
        co_await runtime::yield();
        co_return args["message"];
    };
    return rpc::api_config{test_schema(), std::move(fns)};
}

gateway_config socket_config() {
    gateway_config config;
    config.playground_root = (std::filesystem::temp_directory_path() / "sdkgate_no_playground").string();
    config.enable_logging = false;
    config.max_request_size = 1024;
    return config;
}

std::string post(std::string_view body, std::string_view extra_headers = "Connection: close\r\n") {
    return "POST / HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\n" +
           std::string(extra_headers) +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + std::string(body);
}

/// Send raw bytes and collect everything until the server closes
task<std::string> exchange(const ipv4_address& addr, std::string raw) {
    auto stream = co_await tcp_connect(runtime::current_io_context(), addr);
    REQUIRE(stream.has_value());

    size_t sent = 0;
    while (sent < raw.size()) {
        auto r = co_await stream->write(raw.data() + sent, raw.size() - sent);
        REQUIRE(r.result > 0);
        sent += static_cast<size_t>(r.result);
    }

    std::string received;
    char buf[4096];
    while (true) {
        auto r = co_await stream->read(buf, sizeof(buf));
        if (r.result <= 0) break;
        received.append(buf, static_cast<size_t>(r.result));
    }
    co_return received;
}

/// Start the server, run one client exchange against it and stop it
std::string serve_once(gateway_server& srv, std::string raw) {
    runtime::event_loop loop;

    auto client = [&]() -> task<std::string> {
        srv.listen(ipv4_address("127.0.0.1", 0)).go();
        co_await runtime::yield();

        auto addr = srv.local_address();
        REQUIRE(addr.has_value());
        REQUIRE(addr->port != 0);

        auto received = co_await exchange(*addr, std::move(raw));
        srv.stop();
        co_return received;
    };

    return loop.run(client());
}

size_t count_of(std::string_view haystack, std::string_view needle) {
    size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST_CASE("gateway answers an RPC call over TCP", "[integration][gateway]") {
    gateway_server srv(socket_api(), socket_config());

    auto raw = serve_once(srv, post(R"({"device":{"id":"d1"},"id":"r1","name":"ping","args":{}})"));

    REQUIRE_THAT(raw, StartsWith("HTTP/1.1 200 OK\r\n"));
    REQUIRE_THAT(raw, ContainsSubstring("Connection: close\r\n"));
    REQUIRE_THAT(raw, ContainsSubstring("Content-Type: application/json; charset=utf-8\r\n"));

    auto body = json::parse(raw.substr(raw.find("\r\n\r\n") + 4));
    REQUIRE(body["id"] == "r1");
    REQUIRE(body["deviceId"] == "d1");
    REQUIRE(body["result"] == true);
    REQUIRE_FALSE(srv.is_running());
}

TEST_CASE("gateway serves pipelined keep-alive requests in order", "[integration][gateway]") {
    gateway_server srv(socket_api(), socket_config());

    std::string raw = post(R"({"name":"echo","args":{"message":"first"}})", "") +
                      post(R"({"name":"echo","args":{"message":"second"}})", "") +
                      post(R"({"name":"ping","args":{}})");

    auto received = serve_once(srv, raw);

    REQUIRE(count_of(received, "HTTP/1.1 200 OK\r\n") == 3);
    auto first = received.find("\"first\"");
    auto second = received.find("\"second\"");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(first < second);
    REQUIRE(count_of(received, "x-request-id: ") == 3);
}

TEST_CASE("gateway rejects malformed HTTP", "[integration][gateway]") {
    gateway_server srv(socket_api(), socket_config());

    SECTION("bad request line") {
        auto raw = serve_once(srv, "NONSENSE\r\n\r\n");
        REQUIRE_THAT(raw, StartsWith("HTTP/1.1 400 Bad Request\r\n"));
        REQUIRE_THAT(raw, ContainsSubstring("Connection: close\r\n"));
    }

    SECTION("body over the limit") {
        // Rejected on the headers alone, before any body is sent
        auto raw = serve_once(srv, "POST / HTTP/1.1\r\nHost: localhost\r\nContent-Length: 2048\r\n\r\n");
        REQUIRE_THAT(raw, StartsWith("HTTP/1.1 413 Payload Too Large\r\n"));
    }
}

TEST_CASE("HEAD over TCP keeps the length and drops the body", "[integration][gateway]") {
    gateway_server srv(socket_api(), socket_config());

    auto raw = serve_once(srv, "HEAD /ast.json HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

    // No HEAD route for ast.json, so the RPC root answers
    REQUIRE_THAT(raw, StartsWith("HTTP/1.1 200 OK\r\n"));
    REQUIRE_THAT(raw, ContainsSubstring("Content-Length: 0\r\n"));
    REQUIRE(raw.ends_with("\r\n\r\n"));
}

TEST_CASE("listen fails on an address in use", "[integration][gateway]") {
    runtime::event_loop loop;
    auto taken = tcp_listener::bind(ipv4_address("127.0.0.1", 0), loop.io_context());
    REQUIRE(taken.has_value());
    auto addr = taken->local_address();

    gateway_server srv(socket_api(), socket_config());
    tcp_options opts;
    opts.reuse_port = false;

    REQUIRE_THROWS_AS(loop.run(srv.listen(addr, opts)), std::system_error);
    REQUIRE_FALSE(srv.is_running());
}
