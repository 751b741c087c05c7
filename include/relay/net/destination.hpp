#pragma once

#include <relay/http/http_common.hpp>
#include <relay/error.hpp>

#include <arpa/inet.h>
#include <string>
#include <string_view>

namespace relay::net {

enum class scheme_kind {
    plain,   ///< http
    secure   ///< https
};

/// Where a connection goes: scheme, host and port
///
/// Derived from a URL and never modified afterwards.
class destination {
public:
    destination(scheme_kind scheme, std::string host, uint16_t port)
        : scheme_(scheme), host_(std::move(host)), port_(port) {}

    scheme_kind scheme() const noexcept { return scheme_; }
    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    bool is_secure() const noexcept { return scheme_ == scheme_kind::secure; }

    /// Pool key, e.g. "https://example.com:443"
    std::string key() const {
        std::string out = is_secure() ? "https://" : "http://";
        if (host_.find(':') != std::string::npos) {
            out += "[" + host_ + "]";
        } else {
            out += host_;
        }
        out += ":" + std::to_string(port_);
        return out;
    }

    static result<destination> from_url(const http::url& u) {
        if (u.scheme.empty()) {
            return fail(errc::invalid_url, "invalid URI: missing scheme");
        }
        scheme_kind scheme;
        if (u.scheme == "http") {
            scheme = scheme_kind::plain;
        } else if (u.scheme == "https") {
            scheme = scheme_kind::secure;
        } else {
            return fail(errc::unsupported_scheme, "invalid URI: expected `http` or `https` scheme",
                        0, "scheme `" + u.scheme + "`");
        }
        if (u.host.empty()) {
            return fail(errc::invalid_url, "invalid URI: missing host");
        }
        uint16_t port = u.port != 0 ? u.port
                                    : (scheme == scheme_kind::secure ? 443 : 80);
        return destination(scheme, strip_ipv6_brackets(u.host), port);
    }

    static result<destination> parse(std::string_view text) {
        auto u = http::url::parse(text);
        if (!u) {
            return fail(errc::invalid_url, "invalid URI: " + std::string(text));
        }
        return from_url(*u);
    }

private:
    /// "[::1]" -> "::1"; anything that is not a bracketed IPv6 literal is kept
    static std::string strip_ipv6_brackets(const std::string& host) {
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            std::string inner = host.substr(1, host.size() - 2);
            in6_addr addr{};
            if (::inet_pton(AF_INET6, inner.c_str(), &addr) == 1) {
                return inner;
            }
        }
        return host;
    }

    scheme_kind scheme_;
    std::string host_;
    uint16_t port_;
};

} // namespace relay::net
