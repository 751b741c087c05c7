#pragma once

#include <relay/net/tcp.hpp>
#include <relay/sync/event.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/coro/task.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace relay::net {

/// `host` as a literal IPv4 or IPv6 address, if it is one
inline std::optional<socket_address> numeric_address(const std::string& host, uint16_t port) {
    socket_address numeric;
    auto* v4 = reinterpret_cast<sockaddr_in*>(&numeric.storage);
    if (::inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        numeric.length = sizeof(sockaddr_in);
        return numeric;
    }
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&numeric.storage);
    if (::inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        numeric.length = sizeof(sockaddr_in6);
        return numeric;
    }
    return std::nullopt;
}

/// Resolve `host` to stream socket addresses, in resolver order
///
/// Numeric hosts are returned without a lookup. Otherwise this blocks the
/// calling thread for the duration of the query; coroutines use
/// async_resolve().
inline result<std::vector<socket_address>> resolve(const std::string& host, uint16_t port) {
    if (auto numeric = numeric_address(host, port)) {
        return std::vector<socket_address>{*numeric};
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_ADDRCONFIG;

    addrinfo* list = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
    if (rc != 0) {
        int code = rc == EAI_SYSTEM ? errno : 0;
        return fail(errc::connect, "failed to resolve " + host, code, ::gai_strerror(rc));
    }

    std::vector<socket_address> out;
    for (auto* ai = list; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        socket_address addr;
        std::memcpy(&addr.storage, ai->ai_addr, ai->ai_addrlen);
        addr.length = static_cast<socklen_t>(ai->ai_addrlen);
        out.push_back(addr);
    }
    ::freeaddrinfo(list);

    if (out.empty()) {
        return fail(errc::connect, "no addresses for " + host);
    }
    return out;
}

/// Blocking lookup run by async_resolve(); resolve() unless replaced
using lookup_function = std::function<result<std::vector<socket_address>>(const std::string&, uint16_t)>;

/// Resolve without blocking the worker
///
/// Numeric hosts are answered inline. Any other name is looked up on a
/// thread of its own while the coroutine waits on an event; the answer is
/// delivered back on the waiting worker. Cancelling the token abandons the
/// wait at once. The lookup thread then finishes on its own and its answer
/// is discarded.
inline coro::task<result<std::vector<socket_address>>>
async_resolve(std::string host, uint16_t port, coro::cancel_token token = {},
              lookup_function lookup = resolve) {
    if (auto numeric = numeric_address(host, port)) {
        co_return std::vector<socket_address>{*numeric};
    }
    if (token.is_cancelled()) {
        co_return fail(errc::cancelled, "name resolution cancelled");
    }

    struct pending_lookup {
        sync::event done;
        std::mutex mutex;
        std::optional<result<std::vector<socket_address>>> answer;
    };
    auto state = std::make_shared<pending_lookup>();

    try {
        std::thread([state, host, port, lookup = std::move(lookup)] {
            auto answer = lookup(host, port);
            {
                std::lock_guard<std::mutex> guard(state->mutex);
                state->answer.emplace(std::move(answer));
            }
            state->done.set();
        }).detach();
    } catch (const std::system_error& e) {
        RELAY_LOG_ERROR("cannot start lookup for {}: {}", host, e.what());
        co_return fail(errc::connect, "failed to resolve " + host, e.code().value(),
                       "resolver thread unavailable");
    }

    {
        auto reg = token.on_cancel([state] { state->done.set(); });
        co_await state->done.wait();
    }

    std::lock_guard<std::mutex> guard(state->mutex);
    if (state->answer) {
        co_return std::move(*state->answer);
    }
    RELAY_LOG_DEBUG("lookup of {} abandoned", host);
    co_return fail(errc::cancelled, "name resolution cancelled");
}

} // namespace relay::net
