#include <catch2/catch_test_macros.hpp>
#include <relay/net/destination.hpp>
#include <relay/http/http_common.hpp>

using namespace relay;
using namespace relay::net;

TEST_CASE("destination from http and https URLs", "[destination]") {
    auto plain = destination::parse("http://example.com/path");
    REQUIRE(plain.has_value());
    REQUIRE(plain->scheme() == scheme_kind::plain);
    REQUIRE(plain->host() == "example.com");
    REQUIRE(plain->port() == 80);
    REQUIRE_FALSE(plain->is_secure());
    REQUIRE(plain->key() == "http://example.com:80");

    auto secure = destination::parse("https://example.com");
    REQUIRE(secure.has_value());
    REQUIRE(secure->is_secure());
    REQUIRE(secure->port() == 443);
    REQUIRE(secure->key() == "https://example.com:443");
}

TEST_CASE("destination honours explicit ports", "[destination]") {
    auto d = destination::parse("https://example.com:8443/");
    REQUIRE(d.has_value());
    REQUIRE(d->port() == 8443);

    auto odd = destination::parse("http://example.com:443/");
    REQUIRE(odd.has_value());
    REQUIRE_FALSE(odd->is_secure());
    REQUIRE(odd->port() == 443);
}

TEST_CASE("scheme matching is case-insensitive", "[destination]") {
    auto d = destination::parse("HTTPS://Example.com/");
    REQUIRE(d.has_value());
    REQUIRE(d->is_secure());
}

TEST_CASE("IPv6 literals lose their brackets", "[destination]") {
    auto d = destination::parse("http://[::1]:8080/");
    REQUIRE(d.has_value());
    REQUIRE(d->host() == "::1");
    REQUIRE(d->port() == 8080);
    REQUIRE(d->key() == "http://[::1]:8080");
}

TEST_CASE("destination errors", "[destination]") {
    SECTION("missing scheme") {
        auto d = destination::parse("example.com/path");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().is(errc::invalid_url));
        REQUIRE(d.error().message() == "invalid URI: missing scheme");
    }

    SECTION("unsupported scheme") {
        auto d = destination::parse("ftp://example.com/");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().is(errc::unsupported_scheme));
        REQUIRE(d.error().message() == "invalid URI: expected `http` or `https` scheme");
        REQUIRE(d.error().cause() == "scheme `ftp`");
    }

    SECTION("missing host") {
        auto d = destination::parse("http:///path");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().is(errc::invalid_url));
        REQUIRE(d.error().message() == "invalid URI: missing host");
    }

    SECTION("malformed URL") {
        auto d = destination::parse("http://example.com:notaport/");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().is(errc::invalid_url));
    }
}

TEST_CASE("destination from a parsed url", "[destination]") {
    auto u = http::url::parse("https://api.example.com:9443/v1");
    REQUIRE(u.has_value());
    auto d = destination::from_url(*u);
    REQUIRE(d.has_value());
    REQUIRE(d->host() == "api.example.com");
    REQUIRE(d->port() == 9443);
}
