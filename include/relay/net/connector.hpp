#pragma once

#include <relay/net/destination.hpp>
#include <relay/net/dialer.hpp>
#include <relay/tls/tls_provider.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/time/timer.hpp>
#include <relay/log/macros.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace relay::net {

struct connector_options {
    bool require_tls = false;   ///< Reject plain http destinations
    bool no_delay = true;       ///< TCP_NODELAY on dialed sockets
    /// Limit on dial plus handshake (std::nullopt = no limit)
    std::optional<std::chrono::milliseconds> connect_timeout;
};

/// Opens one fresh transport stream per destination
///
/// Plain destinations get the dialed TCP stream as is. Secure destinations
/// are handed to the TLS provider, which is never consulted otherwise.
/// A connector is immutable after construction; copies share the provider
/// and the dialer and may be used from any number of coroutines at once.
/// The task returned by connect() holds its own references, so the
/// connector itself may go away before the task is awaited.
///
/// @code
/// net::connector conn(tls::openssl_provider::create().value());
/// auto stream = co_await conn.connect("https://example.com/");
/// @endcode
class connector {
public:
    using stream_result = result<std::unique_ptr<byte_stream>>;

    explicit connector(std::shared_ptr<tls::tls_provider> provider = nullptr,
                       connector_options opts = {},
                       std::shared_ptr<dialer> dial = nullptr)
        : provider_(std::move(provider))
        , opts_(opts)
        , dialer_(std::move(dial)) {
        if (!dialer_) {
            tcp_options tcp;
            tcp.no_delay = opts_.no_delay;
            dialer_ = std::make_shared<tcp_dialer>(tcp);
        }
    }

    const connector_options& options() const noexcept { return opts_; }
    bool has_tls() const noexcept { return provider_ != nullptr; }

    coro::task<stream_result> connect(destination dest, coro::cancel_token token = {}) const {
        return establish(provider_, dialer_, opts_, std::move(dest), std::move(token));
    }

    /// Parse `url` into a destination and connect to it
    coro::task<stream_result> connect(std::string url, coro::cancel_token token = {}) const {
        return establish_url(provider_, dialer_, opts_, std::move(url), std::move(token));
    }

private:
    static coro::task<stream_result>
    establish_url(std::shared_ptr<tls::tls_provider> provider, std::shared_ptr<dialer> dial,
                  connector_options opts, std::string url, coro::cancel_token token) {
        auto dest = destination::parse(url);
        if (!dest) {
            co_return std::unexpected(std::move(dest.error()));
        }
        co_return co_await establish(std::move(provider), std::move(dial), opts,
                                     std::move(*dest), std::move(token));
    }

    static coro::task<stream_result>
    establish(std::shared_ptr<tls::tls_provider> provider, std::shared_ptr<dialer> dial,
              connector_options opts, destination dest, coro::cancel_token token) {
        if (opts.require_tls && !dest.is_secure()) {
            co_return fail(errc::unsupported_scheme, "invalid URI: expected `https` scheme");
        }
        if (dest.is_secure() && !provider) {
            co_return fail(errc::unsupported_scheme, "invalid URI: expected `http` scheme",
                           0, "no TLS provider configured");
        }
        if (!opts.connect_timeout) {
            co_return co_await attempt(provider, dial, dest, std::move(token));
        }

        // The attempt runs under its own source, cancelled by either the
        // caller's token or the watchdog
        coro::cancel_source attempt_source;
        auto link = token.on_cancel([attempt_source]() mutable { attempt_source.cancel(); });
        coro::cancel_source timer_source;
        auto timed_out = std::make_shared<std::atomic<bool>>(false);
        auto watch = watchdog(*opts.connect_timeout, timer_source.get_token(),
                              attempt_source, timed_out).spawn();

        auto outcome = co_await attempt(provider, dial, dest, attempt_source.get_token());
        timer_source.cancel();
        co_await watch;
        link.unregister();

        if (!outcome && timed_out->load() && !token.is_cancelled()) {
            RELAY_LOG_ERROR("connect to {} timed out after {}ms", dest.key(),
                            opts.connect_timeout->count());
            co_return fail(errc::connect, "connection timed out", ETIMEDOUT);
        }
        co_return outcome;
    }

    static coro::task<void> watchdog(std::chrono::milliseconds limit, coro::cancel_token stop,
                                     coro::cancel_source target,
                                     std::shared_ptr<std::atomic<bool>> timed_out) {
        auto waited = co_await time::sleep_for(limit, stop);
        if (waited == coro::cancel_result::completed) {
            timed_out->store(true);
            target.cancel();
        }
    }

    /// Dial, then handshake for secure destinations
    static coro::task<stream_result>
    attempt(std::shared_ptr<tls::tls_provider> provider, std::shared_ptr<dialer> dial,
            destination dest, coro::cancel_token token) {
        auto stream = co_await dial->dial(dest.host(), dest.port(), token);
        if (!stream) {
            if (!stream.error().is(errc::cancelled)) {
                RELAY_LOG_ERROR("connect to {} failed: {}", dest.key(), stream.error());
            }
            co_return std::unexpected(std::move(stream.error()));
        }

        if (!dest.is_secure()) {
            co_return std::move(*stream);
        }

        auto aborter = (*stream)->aborter();
        stream_result secured;
        {
            auto reg = token.on_cancel([aborter] { aborter->abort(); });
            secured = co_await provider->handshake(std::move(*stream), dest.host());
        }

        if (token.is_cancelled()) {
            if (secured) {
                co_await (*secured)->close();
            }
            co_return fail(errc::cancelled, "TLS handshake cancelled");
        }
        if (!secured) {
            RELAY_LOG_ERROR("TLS handshake with {} failed: {}", dest.key(), secured.error());
            if (secured.error().is(errc::tls)) {
                co_return std::unexpected(std::move(secured.error()));
            }
            co_return fail(errc::tls, "handshake with " + dest.host() + " failed",
                           secured.error().code(), secured.error().to_string());
        }
        co_return std::move(*secured);
    }

    std::shared_ptr<tls::tls_provider> provider_;
    connector_options opts_;
    std::shared_ptr<dialer> dialer_;
};

} // namespace relay::net
