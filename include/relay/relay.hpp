#pragma once

/// relay HTTP client - main header
///
/// Pulls in the async client, the blocking adapter and the OpenSSL
/// provider together with the runtime they run on.

#define RELAY_VERSION_MAJOR 1
#define RELAY_VERSION_MINOR 0
#define RELAY_VERSION_PATCH 0

// Error model and logging
#include "error.hpp"
#include "log/logger.hpp"
#include "log/macros.hpp"

// Coroutines and runtime
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"
#include "runtime/scheduler.hpp"
#include "runtime/async_main.hpp"
#include "sync/event.hpp"
#include "time/timer.hpp"

// Transport
#include "net/byte_stream.hpp"
#include "net/tcp.hpp"
#include "net/resolver.hpp"
#include "net/dialer.hpp"
#include "net/destination.hpp"
#include "net/connector.hpp"

// TLS
#include "tls/tls.hpp"

// HTTP
#include "http/http.hpp"

// Blocking adapter
#include "blocking/context.hpp"
#include "blocking/client.hpp"

#include <tuple>

namespace relay {

inline const char* version() noexcept {
    return "1.0.0";
}

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(RELAY_VERSION_MAJOR, RELAY_VERSION_MINOR, RELAY_VERSION_PATCH);
}

} // namespace relay
