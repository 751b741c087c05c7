#include <catch2/catch_test_macros.hpp>
#include <relay/tls/tls.hpp>
#include <relay/net/connector.hpp>
#include <relay/runtime/async_main.hpp>
#include <climits>
#include <cstdint>
#include "../test_main.cpp"
#include "../test_doubles.hpp"

using namespace relay;
using namespace relay::tls;
using namespace relay::test;

namespace {

using stream_result = result<std::unique_ptr<net::byte_stream>>;

stream_result handshake_blocking(std::shared_ptr<openssl_provider> provider,
                                 std::unique_ptr<net::byte_stream> stream,
                                 std::string hostname) {
    auto run_handshake = [](std::shared_ptr<openssl_provider> p,
                            std::unique_ptr<net::byte_stream> s,
                            std::string host) -> coro::task<stream_result> {
        co_return co_await p->handshake(std::move(s), std::move(host));
    };
    return relay::run(run_handshake(std::move(provider), std::move(stream), std::move(hostname)), 1);
}

} // namespace

TEST_CASE("tls_context configuration", "[tls][context]") {
    tls_context ctx;
    REQUIRE(ctx.native_handle() != nullptr);
    REQUIRE(ctx.get_verify_mode() == verify_mode::none);

    ctx.set_verify_mode(verify_mode::peer);
    REQUIRE(ctx.get_verify_mode() == verify_mode::peer);

    REQUIRE(ctx.set_alpn_protocols("h2,http/1.1").has_value());
    REQUIRE(ctx.set_alpn_protocols("").has_value());

    auto missing = ctx.load_verify_locations("/nonexistent/ca.pem");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().is(errc::tls));

    tls_context moved = std::move(ctx);
    REQUIRE(moved.native_handle() != nullptr);
    REQUIRE(ctx.native_handle() == nullptr);
}

TEST_CASE("openssl_provider creation", "[tls][provider]") {
    auto provider = openssl_provider::create();
    REQUIRE(provider.has_value());
    REQUIRE((*provider)->options().verify_peer);
    REQUIRE((*provider)->context().get_verify_mode() == verify_mode::peer);

    openssl_options bad;
    bad.ca_file = "/nonexistent/ca.pem";
    auto failed = openssl_provider::create(bad);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().is(errc::tls));

    REQUIRE_THROWS_AS(openssl_provider(bad), relay::exception);
}

TEST_CASE("empty host name fails the handshake", "[tls][provider]") {
    auto provider = openssl_provider::create().value();
    auto rec = std::make_shared<stream_record>();

    auto secured = handshake_blocking(provider, std::make_unique<recording_stream>("", rec), "");
    REQUIRE_FALSE(secured.has_value());
    REQUIRE(secured.error().is(errc::tls));
    REQUIRE(secured.error().message() == "invalid host name");
    REQUIRE(rec->closed);
    REQUIRE(rec->written().empty());
}

TEST_CASE("peer closing mid-handshake is a TLS error", "[tls][provider]") {
    auto provider = openssl_provider::create().value();
    auto rec = std::make_shared<stream_record>();

    auto secured = handshake_blocking(provider, std::make_unique<recording_stream>("", rec),
                                      "example.com");
    REQUIRE_FALSE(secured.has_value());
    REQUIRE(secured.error().is(errc::tls));
    REQUIRE(rec->closed);

    // A ClientHello went out: TLS handshake record type
    auto hello = rec->written();
    REQUIRE_FALSE(hello.empty());
    REQUIRE(static_cast<unsigned char>(hello[0]) == 0x16);
}

TEST_CASE("plain HTTP answer is a TLS error", "[tls][provider]") {
    auto provider = openssl_provider::create().value();
    auto rec = std::make_shared<stream_record>();

    auto secured = handshake_blocking(
        provider,
        std::make_unique<recording_stream>("HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n", rec),
        "example.com");
    REQUIRE_FALSE(secured.has_value());
    REQUIRE(secured.error().is(errc::tls));
    REQUIRE_FALSE(secured.error().cause().empty());
    REQUIRE(rec->closed);
}

TEST_CASE("https to a plain HTTP server fails with a TLS error", "[tls][connector]") {
    stub_http_server::options opts;
    opts.eager = true;
    stub_http_server server(opts);
    net::connector conn(openssl_provider::create().value());

    auto attempt = [&conn, url = server.url("/", "https")]() -> coro::task<stream_result> {
        co_return co_await conn.connect(url);
    };
    auto stream = relay::run(attempt(), 1);
    REQUIRE_FALSE(stream.has_value());
    REQUIRE(stream.error().is(errc::tls));
}

TEST_CASE("TLS reads and writes never pass more than INT_MAX to OpenSSL", "[tls][stream]") {
    STATIC_REQUIRE(tls::detail::ssl_length(0) == 0);
    STATIC_REQUIRE(tls::detail::ssl_length(16384) == 16384);
    STATIC_REQUIRE(tls::detail::ssl_length(static_cast<size_t>(INT_MAX)) == INT_MAX);
    STATIC_REQUIRE(tls::detail::ssl_length(static_cast<size_t>(INT_MAX) + 1) == INT_MAX);
    STATIC_REQUIRE(tls::detail::ssl_length(SIZE_MAX) == INT_MAX);
}

TEST_CASE("connect_timeout covers a stalled handshake", "[tls][connector][timeout]") {
    auto rec = std::make_shared<stream_record>();
    auto dialer = std::make_shared<counting_dialer>([rec] {
        // Swallows the ClientHello and never answers
        return std::make_unique<recording_stream>("", rec, true);
    });
    net::connector_options opts;
    opts.connect_timeout = std::chrono::milliseconds(50);
    net::connector conn(openssl_provider::create().value(), opts, dialer);

    auto attempt = [](net::connector c) -> coro::task<stream_result> {
        co_return co_await c.connect("https://example.com/");
    };
    auto start = std::chrono::steady_clock::now();
    auto stream = relay::run(attempt(conn), 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(stream.has_value());
    REQUIRE(stream.error().is(errc::connect));
    REQUIRE(stream.error().message() == "connection timed out");
    REQUIRE(rec->aborted);
    REQUIRE(rec->closed);
    REQUIRE(elapsed < scaled_ms(2000));
}
