#include <catch2/catch_test_macros.hpp>
#include <relay/blocking/client.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <span>
#include <thread>
#include <vector>
#include "../test_main.cpp"
#include "../test_doubles.hpp"

using namespace relay;
using namespace relay::test;

namespace {

constexpr std::string_view canned_ok = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";

blocking::client_options with_workers(size_t n) {
    blocking::client_options opts;
    opts.worker_threads = n;
    return opts;
}

} // namespace

TEST_CASE("blocking GET reads the whole body", "[integration][blocking]") {
    stub_http_server server;
    auto c = blocking::client::create();
    REQUIRE(c.has_value());
    REQUIRE(c->context().worker_threads() == 1);

    auto resp = c->get(server.url());
    REQUIRE(resp.has_value());
    REQUIRE(resp->status_code() == 200);
    REQUIRE(resp->version() == "HTTP/1.1");
    REQUIRE(resp->header("Content-Length") == "13");

    auto text = resp->body().read_to_string();
    REQUIRE(text.has_value());
    REQUIRE(*text == "Hello, world!");
    REQUIRE(resp->body().is_finished());

    // Further reads report the end of the body
    char buf[4];
    REQUIRE(resp->body().read(buf, sizeof(buf)).value() == 0);
}

TEST_CASE("blocking body reads in small pieces", "[integration][blocking]") {
    stub_http_server server;
    blocking::client c;

    auto resp = c.get(server.url());
    REQUIRE(resp.has_value());

    std::string collected;
    std::array<char, 3> buf{};
    while (true) {
        auto n = resp->body().read(std::span<char>(buf));
        REQUIRE(n.has_value());
        if (*n == 0) break;
        REQUIRE(*n <= buf.size());
        collected.append(buf.data(), *n);
    }
    REQUIRE(collected == "Hello, world!");
}

TEST_CASE("more callers than workers all complete", "[integration][blocking][concurrency]") {
    stub_http_server::options opts;
    opts.delay = std::chrono::milliseconds(300);
    stub_http_server server(opts);
    blocking::client c(net::connector{}, with_workers(1));

    constexpr int callers = 8;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&] {
            auto resp = c.get(server.url());
            if (!resp) return;
            auto text = resp->body().read_to_string();
            if (text && *text == "Hello, world!") {
                succeeded.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(succeeded.load() == callers);
    REQUIRE(server.connections() == callers);
    // One worker still overlaps the waits
    REQUIRE(elapsed < scaled_ms(callers * 300 / 2));
}

TEST_CASE("requests fail with closed after close", "[integration][blocking][close]") {
    stub_http_server server;
    blocking::client c;
    REQUIRE_FALSE(c.is_closed());

    c.close();
    REQUIRE(c.is_closed());
    REQUIRE_FALSE(c.context().is_running());

    auto resp = c.get(server.url());
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::closed));
    REQUIRE(server.connections() == 0);

    // Idempotent
    c.close();
}

TEST_CASE("close fails bodies handed out earlier", "[integration][blocking][close]") {
    stub_http_server server;
    blocking::client c;

    auto resp = c.get(server.url());
    REQUIRE(resp.has_value());
    c.close();

    auto text = resp->body().read_to_string();
    REQUIRE_FALSE(text.has_value());
    REQUIRE(text.error().is(errc::closed));
    REQUIRE(resp->body().is_finished());
}

TEST_CASE("close fails calls in flight", "[integration][blocking][close]") {
    stub_http_server::options opts;
    opts.silent = true;
    stub_http_server server(opts);
    blocking::client c;

    auto call = c.submit(http::request::make(http::method::GET, server.url()).value());
    REQUIRE(call.has_value());
    REQUIRE(server.wait_connections(1, scaled_ms(2000)));

    c.close();
    auto resp = call->wait();
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::closed));
    REQUIRE(c.context().in_flight() == 0);
}

TEST_CASE("bodies outlive the client that produced them", "[integration][blocking]") {
    stub_http_server server;
    std::optional<blocking::response> kept;
    {
        blocking::client c(net::connector{}, with_workers(2));
        auto resp = c.get(server.url());
        REQUIRE(resp.has_value());
        kept.emplace(std::move(*resp));
    }

    auto text = kept->body().read_to_string();
    REQUIRE(text.has_value());
    REQUIRE(*text == "Hello, world!");
}

TEST_CASE("wait_for gives up without cancelling", "[integration][blocking]") {
    stub_http_server::options opts;
    opts.delay = std::chrono::milliseconds(200);
    stub_http_server server(opts);
    blocking::client c;

    auto call = c.submit(http::request::make(http::method::GET, server.url()).value());
    REQUIRE(call.has_value());

    auto early = call->wait_for(std::chrono::milliseconds(10));
    REQUIRE_FALSE(early.has_value());
    REQUIRE_FALSE(call->is_ready());

    auto late = call->wait_for(scaled_ms(3000));
    REQUIRE(late.has_value());
    REQUIRE(late->has_value());
    REQUIRE((*late)->body().read_to_string().value() == "Hello, world!");
}

TEST_CASE("cancelling a pending call", "[integration][blocking][cancel]") {
    auto rec = std::make_shared<stream_record>();
    auto dialer = std::make_shared<counting_dialer>([rec] {
        return std::make_unique<recording_stream>("", rec, true);
    });
    blocking::client c(net::connector(nullptr, {}, dialer));

    auto call = c.submit(http::request::make(http::method::GET, "http://example.com/").value());
    REQUIRE(call.has_value());
    REQUIRE(wait_until([&] { return !rec->written().empty(); }, scaled_ms(2000)));

    call->cancel();
    auto resp = call->wait();
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::cancelled));
    REQUIRE(rec->aborted);
    REQUIRE(wait_until([&] { return rec->closed.load(); }, scaled_ms(2000)));
}

TEST_CASE("dropping a pending call closes its connection", "[integration][blocking][cancel]") {
    auto rec = std::make_shared<stream_record>();
    auto dialer = std::make_shared<counting_dialer>([rec] {
        return std::make_unique<recording_stream>("", rec, true);
    });
    blocking::client c(net::connector(nullptr, {}, dialer));

    {
        auto call = c.submit(http::request::make(http::method::GET, "http://example.com/").value());
        REQUIRE(call.has_value());
        REQUIRE(wait_until([&] { return !rec->written().empty(); }, scaled_ms(2000)));
    }

    REQUIRE(wait_until([&] { return rec->closed.load(); }, scaled_ms(2000)));
    REQUIRE(wait_until([&] { return c.context().in_flight() == 0; }, scaled_ms(2000)));
    REQUIRE(c.engine().pool()->idle_count() == 0);
}

TEST_CASE("a request stuck in name resolution does not hold up others", "[integration][blocking][net]") {
    stub_http_server server;
    auto lookups = std::make_shared<std::atomic<int>>(0);
    std::promise<void> release;
    auto gate = release.get_future().share();
    net::lookup_function stuck = [gate, lookups](const std::string&, uint16_t port) {
        lookups->fetch_add(1);
        gate.wait_for(scaled_ms(3000));
        return net::resolve("127.0.0.1", port);
    };
    auto dialer = std::make_shared<net::tcp_dialer>(net::tcp_options{}, stuck);
    blocking::client c(net::connector(nullptr, {}, dialer), with_workers(1));

    auto pending = c.submit(http::request::make(http::method::GET, "http://stuck.example/").value());
    REQUIRE(pending.has_value());
    REQUIRE(wait_until([&] { return lookups->load() == 1; }, scaled_ms(2000)));

    auto start = std::chrono::steady_clock::now();
    auto quick = c.get(server.url());
    REQUIRE(quick.has_value());
    REQUIRE(quick->body().read_to_string().value() == "Hello, world!");
    REQUIRE(std::chrono::steady_clock::now() - start < scaled_ms(1000));

    start = std::chrono::steady_clock::now();
    pending->cancel();
    auto abandoned = pending->wait();
    REQUIRE_FALSE(abandoned.has_value());
    REQUIRE(abandoned.error().is(errc::cancelled));

    c.close();
    REQUIRE(std::chrono::steady_clock::now() - start < scaled_ms(1000));
    release.set_value();
}

TEST_CASE("requests with bodies", "[integration][blocking]") {
    stub_http_server server;
    blocking::client c;

    SECTION("PUT sends the payload") {
        auto resp = c.put(server.url("/item"), http::shared_body(std::string("{\"a\":1}")),
                          http::mime::application_json);
        REQUIRE(resp.has_value());
        REQUIRE(resp->body().read_to_string().has_value());

        auto raw = server.received().at(0);
        REQUIRE(raw.starts_with("PUT /item HTTP/1.1\r\n"));
        REQUIRE(raw.ends_with("{\"a\":1}"));
    }

    SECTION("GET with a body is refused") {
        auto req = http::request::make(http::method::GET, server.url()).value();
        req.set_body(http::shared_body::from_static("x"));
        auto resp = c.execute(std::move(req));
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().is(errc::body_not_allowed));
        REQUIRE(server.connections() == 0);
    }
}

TEST_CASE("invalid URLs are reported synchronously", "[integration][blocking]") {
    blocking::client c;

    auto missing = c.get("example.com/path");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().is(errc::invalid_url));

    auto scheme = c.get("ftp://example.com/");
    REQUIRE_FALSE(scheme.has_value());
    REQUIRE(scheme.error().is(errc::unsupported_scheme));
}

TEST_CASE("client teardown leaves no threads behind", "[integration][blocking][threads]") {
    auto dialer = std::make_shared<counting_dialer>([] {
        return std::make_unique<recording_stream>(std::string(canned_ok));
    });
    auto before = thread_count();

    {
        blocking::client c(net::connector(nullptr, {}, dialer), with_workers(3));
        REQUIRE(thread_count() >= before + 3);

        auto resp = c.get("http://example.com/");
        REQUIRE(resp.has_value());
        REQUIRE(resp->body().read_to_string().value() == "ok");
    }

    REQUIRE(wait_until([&] { return thread_count() == before; }, scaled_ms(2000)));
    REQUIRE(dialer->dials() == 1);
}

TEST_CASE("client copies share one context", "[integration][blocking]") {
    stub_http_server server;
    blocking::client original;
    blocking::client copy = original;

    REQUIRE(&copy.context() == &original.context());
    REQUIRE(copy.get(server.url()).has_value());

    original.close();
    REQUIRE(copy.is_closed());
    auto resp = copy.get(server.url());
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::closed));
}
