#pragma once

/// @file http.hpp
/// @brief Asynchronous HTTP/1.1 client
///
/// Requests go out over streams obtained from a net::connector; idle
/// keep-alive connections are pooled per destination.

#include <relay/http/http_common.hpp>
#include <relay/http/http_parser.hpp>
#include <relay/http/shared_body.hpp>
#include <relay/http/http_message.hpp>
#include <relay/http/body_reader.hpp>
#include <relay/http/connection_pool.hpp>
#include <relay/http/http_client.hpp>
