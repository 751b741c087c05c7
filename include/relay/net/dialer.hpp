#pragma once

#include <relay/net/resolver.hpp>
#include <relay/net/tcp.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <memory>
#include <optional>
#include <string>

namespace relay::net {

/// Opens the transport connection to a host
///
/// The connector owns one; tests substitute their own.
class dialer {
public:
    virtual ~dialer() = default;

    virtual coro::task<result<std::unique_ptr<byte_stream>>>
    dial(std::string host, uint16_t port, coro::cancel_token token) = 0;
};

/// Resolves the host and tries each address until one accepts
///
/// Name lookups run off the worker (see async_resolve); `lookup` replaces
/// the system resolver.
class tcp_dialer : public dialer {
public:
    explicit tcp_dialer(tcp_options opts = {}, lookup_function lookup = resolve)
        : opts_(opts), lookup_(std::move(lookup)) {}

    coro::task<result<std::unique_ptr<byte_stream>>>
    dial(std::string host, uint16_t port, coro::cancel_token token) override {
        if (token.is_cancelled()) {
            co_return fail(errc::cancelled, "connect cancelled");
        }

        auto addrs = co_await async_resolve(host, port, token, lookup_);
        if (!addrs) {
            co_return std::unexpected(std::move(addrs.error()));
        }

        std::optional<error> last_error;
        for (const auto& addr : *addrs) {
            int fd = open_socket(addr, opts_);
            if (fd < 0) {
                last_error.emplace(errc::connect, "socket() failed", -fd);
                continue;
            }

            auto stream = std::make_unique<tcp_stream>(fd);
            int rc = 0;
            {
                auto aborter = stream->aborter();
                auto reg = token.on_cancel([aborter] { aborter->abort(); });
                rc = co_await connect_awaitable(runtime::current_io_context(), fd, addr);
            }

            if (token.is_cancelled()) {
                co_return fail(errc::cancelled, "connect cancelled");
            }
            if (rc == 0) {
                RELAY_LOG_DEBUG("connected to {} ({})", host, addr.to_string());
                co_return std::unique_ptr<byte_stream>(std::move(stream));
            }

            RELAY_LOG_DEBUG("connect to {} failed: {}", addr.to_string(), std::strerror(-rc));
            last_error.emplace(errc::connect, "failed to connect to " + addr.to_string(), -rc);
        }

        co_return std::unexpected(std::move(*last_error));
    }

private:
    tcp_options opts_;
    lookup_function lookup_;
};

} // namespace relay::net
