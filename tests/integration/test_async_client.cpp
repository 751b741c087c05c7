#include <catch2/catch_test_macros.hpp>
#include <relay/http/http.hpp>
#include <relay/runtime/async_main.hpp>
#include <relay/tls/tls.hpp>
#include <thread>
#include "../test_main.cpp"
#include "../test_doubles.hpp"
#include "../tls_test_server.hpp"

using namespace relay;
using namespace relay::http;
using namespace relay::test;

namespace {

struct fetched {
    uint16_t status = 0;
    std::string body;
};

/// GET `url` and drain the body
coro::task<result<fetched>> fetch(const client& c, std::string url, coro::cancel_token token = {}) {
    auto resp = co_await c.get(url, token);
    if (!resp) {
        co_return std::unexpected(std::move(resp.error()));
    }
    auto text = co_await resp->body().read_all(token);
    if (!text) {
        co_return std::unexpected(std::move(text.error()));
    }
    co_return fetched{resp->status_code(), std::move(*text)};
}

/// Every name resolves to loopback, so certificates can carry made-up names
std::shared_ptr<net::dialer> loopback_dialer() {
    return std::make_shared<net::tcp_dialer>(net::tcp_options{}, [](const std::string&, uint16_t port) {
        return net::resolve("127.0.0.1", port);
    });
}

/// Provider trusting only `cert`
std::shared_ptr<tls::openssl_provider> trusting(const self_signed_cert& cert) {
    tls::openssl_options opts;
    opts.use_system_roots = false;
    opts.ca_file = cert.pem_file();
    return tls::openssl_provider::create(opts).value();
}

} // namespace

TEST_CASE("async GET against a local server", "[integration][client]") {
    stub_http_server server;
    client c;

    auto call = [&c, url = server.url("/hello")]() -> coro::task<result<response>> {
        co_return co_await c.get(url);
    };
    auto resp = relay::run(call(), 2);

    REQUIRE(resp.has_value());
    REQUIRE(resp->status_code() == 200);
    REQUIRE(resp->is_success());
    REQUIRE(resp->reason() == "OK");
    REQUIRE(resp->header("content-length") == "13");

    auto drain = [reader = resp->body_ptr()]() -> coro::task<result<std::string>> {
        co_return co_await reader->read_all();
    };
    REQUIRE(relay::run(drain(), 1).value() == "Hello, world!");

    auto requests = server.received();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].starts_with("GET /hello HTTP/1.1\r\n"));
    REQUIRE(requests[0].find("User-Agent: relay/1.0\r\n") != std::string::npos);
}

TEST_CASE("keep-alive connections are reused", "[integration][client][pool]") {
    stub_http_server::options opts;
    opts.response = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
    opts.keep_alive = true;
    stub_http_server server(opts);
    client c;

    auto twice = [&c, url = server.url()]() -> coro::task<result<std::pair<fetched, fetched>>> {
        auto first = co_await fetch(c, url);
        if (!first) co_return std::unexpected(std::move(first.error()));
        auto second = co_await fetch(c, url);
        if (!second) co_return std::unexpected(std::move(second.error()));
        co_return std::make_pair(std::move(*first), std::move(*second));
    };
    auto both = relay::run(twice(), 2);

    REQUIRE(both.has_value());
    REQUIRE(both->first.body == "hello");
    REQUIRE(both->second.body == "hello");
    REQUIRE(server.connections() == 1);
    REQUIRE(server.requests() == 2);
    REQUIRE(c.pool()->idle_count() == 1);
}

TEST_CASE("connection: close responses are not pooled", "[integration][client][pool]") {
    stub_http_server server;
    client c;

    auto twice = [&c, url = server.url()]() -> coro::task<result<fetched>> {
        auto first = co_await fetch(c, url);
        if (!first) co_return std::unexpected(std::move(first.error()));
        co_return co_await fetch(c, url);
    };
    REQUIRE(relay::run(twice(), 1).has_value());
    REQUIRE(server.wait_connections(2, scaled_ms(1000)));
    REQUIRE(c.pool()->idle_count() == 0);
}

TEST_CASE("request bodies reach the server", "[integration][client]") {
    stub_http_server server;
    client c;

    auto call = [&c, url = server.url("/submit")]() -> coro::task<result<fetched>> {
        auto resp = co_await c.post(url, shared_body(std::string("ping")), mime::text_plain);
        if (!resp) co_return std::unexpected(std::move(resp.error()));
        auto text = co_await resp->body().read_all();
        if (!text) co_return std::unexpected(std::move(text.error()));
        co_return fetched{resp->status_code(), std::move(*text)};
    };
    auto out = relay::run(call(), 1);
    REQUIRE(out.has_value());
    REQUIRE(out->status == 200);

    auto requests = server.received();
    REQUIRE(requests.size() == 1);
    const auto& raw = requests[0];
    REQUIRE(raw.starts_with("POST /submit HTTP/1.1\r\n"));
    REQUIRE(raw.find("Content-Length: 4\r\n") != std::string::npos);
    REQUIRE(raw.find("Content-Type: text/plain") != std::string::npos);
    REQUIRE(raw.ends_with("\r\n\r\nping"));
}

TEST_CASE("GET with a body is rejected before connecting", "[integration][client]") {
    stub_http_server server;
    client c;

    auto req = request::make(method::GET, server.url());
    REQUIRE(req.has_value());
    req->set_body(shared_body::from_static("oops"));

    auto call = [&c, r = std::move(*req)]() mutable -> coro::task<result<response>> {
        co_return co_await c.execute(std::move(r));
    };
    auto resp = relay::run(call(), 1);
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::body_not_allowed));
    REQUIRE(server.connections() == 0);
}

TEST_CASE("https URLs go through the configured provider", "[integration][client][tls]") {
    stub_http_server server;
    auto provider = std::make_shared<stub_tls_provider>();
    client c(net::connector(provider));

    auto call = [&c, url = server.url("/", "https")]() -> coro::task<result<fetched>> {
        co_return co_await fetch(c, url);
    };
    auto out = relay::run(call(), 1);

    REQUIRE(out.has_value());
    REQUIRE(out->body == "Hello, world!");
    REQUIRE(provider->calls() == 1);
    REQUIRE(provider->hostnames().front() == "127.0.0.1");
}

TEST_CASE("https URLs without a provider fail", "[integration][client][tls]") {
    client c;
    auto call = [&c]() -> coro::task<result<response>> {
        co_return co_await c.get("https://127.0.0.1:1/");
    };
    auto resp = relay::run(call(), 1);
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::unsupported_scheme));
}

TEST_CASE("chunked responses are decoded", "[integration][client]") {
    stub_http_server::options opts;
    opts.response =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
        "7\r\nMozilla\r\n9\r\nDeveloper\r\n7\r\nNetwork\r\n0\r\n\r\n";
    stub_http_server server(opts);
    client c;

    auto call = [&c, url = server.url()]() -> coro::task<result<fetched>> {
        co_return co_await fetch(c, url);
    };
    auto out = relay::run(call(), 1);
    REQUIRE(out.has_value());
    REQUIRE(out->body == "MozillaDeveloperNetwork");
}

TEST_CASE("malformed responses are protocol errors", "[integration][client]") {
    stub_http_server::options opts;
    opts.response = "SMTP ready\r\n\r\n";
    stub_http_server server(opts);
    client c;

    auto call = [&c, url = server.url()]() -> coro::task<result<response>> {
        co_return co_await c.get(url);
    };
    auto resp = relay::run(call(), 1);
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::protocol));
}

TEST_CASE("cancelling an in-flight request", "[integration][client][cancel]") {
    stub_http_server::options opts;
    opts.silent = true;
    stub_http_server server(opts);
    client c;
    coro::cancel_source source;

    auto call = [&c, url = server.url(), token = source.get_token()]() -> coro::task<result<response>> {
        co_return co_await c.get(url, token);
    };

    std::thread canceller([&] {
        server.wait_connections(1, scaled_ms(2000));
        std::this_thread::sleep_for(scaled_ms(50));
        source.cancel();
    });
    auto resp = relay::run(call(), 1);
    canceller.join();

    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::cancelled));
    REQUIRE(c.pool()->idle_count() == 0);
}

TEST_CASE("connection refused surfaces as a connect error", "[integration][client]") {
    uint16_t port;
    {
        stub_http_server server;
        port = server.port();
    }
    client c;
    auto call = [&c, url = "http://127.0.0.1:" + std::to_string(port) + "/"]()
        -> coro::task<result<response>> {
        co_return co_await c.get(url);
    };
    auto resp = relay::run(call(), 1);
    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::connect));
}

TEST_CASE("a stale pooled connection is retried once on a fresh one", "[integration][client][pool]") {
    auto dialer = std::make_shared<counting_dialer>([] {
        return std::make_unique<recording_stream>("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    });
    client c(net::connector(nullptr, {}, dialer));

    auto twice = [&c]() -> coro::task<result<fetched>> {
        auto first = co_await fetch(c, "http://example.com/");
        if (!first) co_return std::unexpected(std::move(first.error()));
        // The pooled stream has nothing more to say: it reads as closed
        co_return co_await fetch(c, "http://example.com/");
    };
    auto out = relay::run(twice(), 1);

    REQUIRE(out.has_value());
    REQUIRE(out->body == "ok");
    REQUIRE(dialer->dials() == 2);
}

TEST_CASE("https GET completes a real TLS handshake", "[integration][client][tls]") {
    self_signed_cert cert("relay.test");
    tls_http_server server(cert);
    client c(net::connector(trusting(cert), {}, loopback_dialer()));

    auto call = [&c, url = server.url("relay.test", "/secure")]() -> coro::task<result<fetched>> {
        co_return co_await fetch(c, url);
    };
    auto out = relay::run(call(), 1);

    REQUIRE(out.has_value());
    REQUIRE(out->status == 200);
    REQUIRE(out->body == "Hello, world!");
    REQUIRE(server.handshakes() == 1);
    REQUIRE(server.requests() == 1);
}

TEST_CASE("https fails when the certificate names another host", "[integration][client][tls]") {
    self_signed_cert cert("relay.test");
    tls_http_server server(cert);
    client c(net::connector(trusting(cert), {}, loopback_dialer()));

    auto call = [&c, url = server.url("other.test")]() -> coro::task<result<response>> {
        co_return co_await c.get(url);
    };
    auto resp = relay::run(call(), 1);

    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::tls));
    REQUIRE(wait_until([&] { return server.failed_handshakes() == 1; }, scaled_ms(2000)));
    REQUIRE(server.requests() == 0);
}

TEST_CASE("https fails when the certificate is not trusted", "[integration][client][tls]") {
    self_signed_cert cert("relay.test");
    tls_http_server server(cert);
    tls::openssl_options opts;
    opts.use_system_roots = false;
    client c(net::connector(tls::openssl_provider::create(opts).value(), {}, loopback_dialer()));

    auto call = [&c, url = server.url("relay.test")]() -> coro::task<result<response>> {
        co_return co_await c.get(url);
    };
    auto resp = relay::run(call(), 1);

    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().is(errc::tls));
    REQUIRE(server.requests() == 0);
}
