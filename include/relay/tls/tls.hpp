#pragma once

/// @file tls.hpp
/// @brief OpenSSL-backed TLS provider for the relay connector
///
/// - tls_context: client SSL_CTX (trust store, verification, ALPN)
/// - tls_stream: TLS session over any net::byte_stream via memory BIOs
/// - openssl_provider: tls_provider implementation plugged into net::connector

#include <relay/tls/tls_provider.hpp>
#include <relay/tls/tls_context.hpp>
#include <relay/tls/tls_stream.hpp>
#include <relay/tls/openssl_provider.hpp>
