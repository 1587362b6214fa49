#include <catch2/catch_test_macros.hpp>
#include <sdkgate/io/io_context.hpp>
#include <sdkgate/io/io_awaitables.hpp>
#include <sdkgate/net/tcp.hpp>
#include <sdkgate/coro/task.hpp>
#include <sdkgate/runtime/event_loop.hpp>

#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include "../test_main.cpp"

using namespace sdkgate::io;
using namespace sdkgate::net;
using namespace sdkgate::coro;
using namespace sdkgate::runtime;
using namespace sdkgate::test;

namespace {

/// Connected non-blocking AF_UNIX pair, closed on scope exit
struct socket_pair {
    int near = -1;
    int far = -1;

    socket_pair() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds) == 0);
        near = fds[0];
        far = fds[1];
    }

    ~socket_pair() {
        ::close(near);
        ::close(far);
    }

    void send(std::string_view text) const {
        REQUIRE(::send(near, text.data(), text.size(), 0) == static_cast<ssize_t>(text.size()));
    }
};

/// Start a lazy task by hand so it parks on its first I/O
template<typename T>
void start(task<T>& t) {
    t.handle().resume();
}

void poll_until(io_context& ctx, const bool& flag) {
    for (int i = 0; i < 100 && !flag; ++i) {
        ctx.poll(scaled_ms(10));
    }
}

} // namespace

TEST_CASE("io_result separates counts from errors", "[io]") {
    io_result got{12, 0};
    CHECK(got.success());
    CHECK(got.bytes_transferred() == 12);
    CHECK(got.error_code() == 0);

    io_result reset{-ECONNRESET, 0};
    CHECK_FALSE(reset.success());
    CHECK(reset.bytes_transferred() == 0);
    CHECK(reset.error_code() == ECONNRESET);
}

TEST_CASE("recv parks until the peer writes", "[io][epoll]") {
    socket_pair pair;
    io_context ctx;
    char buffer[64] = {};
    io_result got{};
    bool done = false;

    auto reader_fn = [&]() -> task<void> {
        got = co_await async_recv(ctx, pair.far, buffer, sizeof(buffer) - 1);
        done = true;
    };
    auto reader = reader_fn();
    start(reader);

    REQUIRE(ctx.pending_count() == 1);
    REQUIRE(ctx.poll() == 0);
    REQUIRE_FALSE(done);

    pair.send("hello gateway");
    poll_until(ctx, done);

    REQUIRE(done);
    REQUIRE(got.bytes_transferred() == 13);
    REQUIRE(std::string_view(buffer) == "hello gateway");
    REQUIRE_FALSE(ctx.has_pending());
}

TEST_CASE("a reader and a writer share one descriptor", "[io][epoll]") {
    socket_pair pair;
    io_context ctx;
    char buffer[16] = {};
    bool read_done = false;
    bool write_done = false;
    io_result sent{};

    auto reader_fn = [&]() -> task<void> {
        co_await async_recv(ctx, pair.far, buffer, sizeof(buffer));
        read_done = true;
    };
    auto reader = reader_fn();
    auto writer_fn = [&]() -> task<void> {
        sent = co_await async_send(ctx, pair.far, "out", 3);
        write_done = true;
    };
    auto writer = writer_fn();
    start(reader);
    start(writer);
    REQUIRE(ctx.pending_count() == 2);

    // The socket is writable at once; the read stays parked
    poll_until(ctx, write_done);
    REQUIRE(write_done);
    REQUIRE(sent.result == 3);
    REQUIRE_FALSE(read_done);
    REQUIRE(ctx.pending_count() == 1);

    pair.send("in");
    poll_until(ctx, read_done);
    REQUIRE(read_done);
    REQUIRE_FALSE(ctx.has_pending());
}

TEST_CASE("cancel_fd resumes waiters inline when no hook is set", "[io][cancel]") {
    socket_pair pair;
    io_context ctx;
    char buffer[16];
    io_result got{};
    bool done = false;

    auto reader_fn = [&]() -> task<void> {
        got = co_await async_recv(ctx, pair.far, buffer, sizeof(buffer));
        done = true;
    };
    auto reader = reader_fn();
    start(reader);

    REQUIRE(ctx.cancel_fd(pair.near) == 0);
    REQUIRE(ctx.cancel_fd(pair.far) == 1);
    REQUIRE(done);
    REQUIRE(got.error_code() == ECANCELED);
    REQUIRE(ctx.pending_count() == 0);
}

TEST_CASE("cancel_all hands waiters to the resume hook", "[io][cancel]") {
    socket_pair pair;
    io_context ctx;
    std::vector<std::coroutine_handle<>> handed;
    ctx.set_resume_hook([&](std::coroutine_handle<> h) { handed.push_back(h); });

    char buffer[16];
    bool done = false;
    auto reader_fn = [&]() -> task<void> {
        co_await async_recv(ctx, pair.far, buffer, sizeof(buffer));
        done = true;
    };
    auto reader = reader_fn();
    start(reader);

    REQUIRE(ctx.cancel_all() == 1);
    REQUIRE_FALSE(done);
    REQUIRE(handed.size() == 1);

    handed.front().resume();
    REQUIRE(done);
    ctx.set_resume_hook(nullptr);
}

TEST_CASE("ipv4_address accepts literals only", "[tcp][address]") {
    ipv4_address any(8000);
    REQUIRE(any.to_string() == "0.0.0.0:8000");
    REQUIRE(ipv4_address("", 80).host() == "0.0.0.0");

    ipv4_address loopback("127.0.0.1", 9000);
    REQUIRE(ipv4_address(loopback.to_sockaddr()).to_string() == "127.0.0.1:9000");

    REQUIRE_THROWS_AS(ipv4_address("localhost", 80), std::invalid_argument);
    REQUIRE_THROWS_AS(ipv4_address("300.1.1.1", 80), std::invalid_argument);
}

TEST_CASE("listener bound to port 0 reports the real port", "[tcp][listener]") {
    io_context ctx;
    auto listener = tcp_listener::bind(ipv4_address("127.0.0.1", 0), ctx);
    REQUIRE(listener.has_value());
    REQUIRE(listener->local_address().port != 0);
    REQUIRE(listener->local_address().host() == "127.0.0.1");
}

TEST_CASE("accepted and connected streams echo on one loop", "[tcp][loop]") {
    event_loop loop;
    auto listener = tcp_listener::bind(ipv4_address("127.0.0.1", 0), loop.io_context());
    REQUIRE(listener.has_value());
    auto addr = listener->local_address();

    auto server = [&]() -> task<void> {
        auto stream = co_await listener->accept();
        REQUIRE(stream.has_value());
        char buf[64];
        auto n = co_await stream->read(buf, sizeof(buf));
        REQUIRE(n.bytes_transferred() > 0);
        co_await stream->write(std::string_view(buf, static_cast<size_t>(n.result)));
    };

    auto client = [&]() -> task<std::string> {
        server().go();
        auto stream = co_await tcp_connect(loop.io_context(), addr);
        REQUIRE(stream.has_value());
        REQUIRE(stream->peer_address()->port == addr.port);

        co_await stream->write("ping");
        char buf[64];
        auto n = co_await stream->read(buf, sizeof(buf));
        co_return std::string(buf, static_cast<size_t>(n.bytes_transferred()));
    };

    REQUIRE(loop.run(client()) == "ping");
}

TEST_CASE("closing a listener fails its pending accept", "[tcp][listener][cancel]") {
    event_loop loop;
    auto listener = tcp_listener::bind(ipv4_address("127.0.0.1", 0), loop.io_context());
    REQUIRE(listener.has_value());

    auto acceptor = [&]() -> task<int> {
        auto stream = co_await listener->accept();
        co_return stream ? 0 : stream.error();
    };

    auto closer = [&]() -> task<void> {
        listener->close();
        co_return;
    };

    auto main_task = [&]() -> task<int> {
        closer().go();
        co_return co_await acceptor();
    };

    REQUIRE(loop.run(main_task()) == ECANCELED);
}
