#pragma once

#include <relay/net/byte_stream.hpp>
#include <relay/error.hpp>

#include <memory>
#include <string>

namespace relay::tls {

/// Performs the client side of a TLS handshake over an open stream
///
/// Implementations own the stream they are given. On success the returned
/// stream carries plaintext; on failure the transport is closed and the
/// error is reported as errc::tls. A provider may be shared by many
/// connectors and called concurrently.
class tls_provider {
public:
    virtual ~tls_provider() = default;

    virtual coro::task<result<std::unique_ptr<net::byte_stream>>>
    handshake(std::unique_ptr<net::byte_stream> stream, std::string hostname) = 0;
};

} // namespace relay::tls
