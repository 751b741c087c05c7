#pragma once

#include <relay/http/http_common.hpp>
#include <relay/http/http_parser.hpp>
#include <relay/http/http_message.hpp>
#include <relay/http/connection_pool.hpp>
#include <relay/http/body_reader.hpp>
#include <relay/net/connector.hpp>
#include <relay/coro/task.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/log/macros.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay::http {

/// HTTP client configuration
struct client_config {
    size_t read_buffer_size = 8192;                    ///< Read buffer size
    std::string user_agent = "relay/1.0";              ///< User-Agent header, empty to omit
    std::optional<size_t> pool_max_idle_per_host;      ///< Idle connections per host (unlimited)
    std::optional<std::chrono::milliseconds> pool_idle_timeout = std::chrono::seconds(90);
};

/// Asynchronous HTTP/1.1 client
///
/// Connections come from the connector and are kept in a pool between
/// requests. A request that fails on a reused connection before any
/// response byte arrives is sent once more on a fresh connection; nothing
/// else is retried. Redirects are not followed.
///
/// The client may be used from many coroutines at once. A request in
/// flight holds what it needs, so the client itself may be destroyed while
/// requests are still running.
///
/// @code
/// http::client c(net::connector(tls::openssl_provider::create().value()));
/// auto resp = co_await c.get("https://example.com/");
/// if (resp) {
///     auto body = co_await resp->body().read_all();
/// }
/// @endcode
class client {
public:
    explicit client(net::connector conn = net::connector{}, client_config config = {})
        : connector_(std::move(conn))
        , config_(std::move(config))
        , pool_(std::make_shared<connection_pool>(
              pool_config{config_.pool_max_idle_per_host, config_.pool_idle_timeout})) {}

    coro::task<result<response>> execute(request req, coro::cancel_token token = {}) {
        return run(connector_, pool_, config_, std::move(req), std::move(token));
    }

    coro::task<result<response>> get(std::string_view url, coro::cancel_token token = {}) {
        return send(method::GET, url, std::nullopt, {}, std::move(token));
    }

    coro::task<result<response>> head(std::string_view url, coro::cancel_token token = {}) {
        return send(method::HEAD, url, std::nullopt, {}, std::move(token));
    }

    coro::task<result<response>> del(std::string_view url, coro::cancel_token token = {}) {
        return send(method::DELETE_, url, std::nullopt, {}, std::move(token));
    }

    coro::task<result<response>> post(std::string_view url, shared_body body,
                                      std::string_view content_type = mime::application_octet_stream,
                                      coro::cancel_token token = {}) {
        return send(method::POST, url, std::move(body), content_type, std::move(token));
    }

    coro::task<result<response>> put(std::string_view url, shared_body body,
                                     std::string_view content_type = mime::application_octet_stream,
                                     coro::cancel_token token = {}) {
        return send(method::PUT, url, std::move(body), content_type, std::move(token));
    }

    coro::task<result<response>> patch(std::string_view url, shared_body body,
                                       std::string_view content_type = mime::application_octet_stream,
                                       coro::cancel_token token = {}) {
        return send(method::PATCH, url, std::move(body), content_type, std::move(token));
    }

    const client_config& config() const noexcept { return config_; }
    const net::connector& get_connector() const noexcept { return connector_; }

    /// Shared with in-flight bodies, which return their connection to it
    const std::shared_ptr<connection_pool>& pool() const noexcept { return pool_; }

private:
    /// Everything an exchange needs, shared between the first try and the retry
    struct prepared_request {
        method m;
        std::string head;
        std::optional<shared_body> body;
        std::string key;
        bool client_close = false;
    };

    struct exchange_outcome {
        result<response> value;
        bool stale = false;   ///< Failed on a reused connection before any response byte
    };

    coro::task<result<response>> send(method m, std::string_view url,
                                      std::optional<shared_body> body,
                                      std::string_view content_type,
                                      coro::cancel_token token) {
        auto req = request::make(m, url);
        if (!req) {
            return failed(std::move(req.error()));
        }
        if (body) {
            req->set_body(std::move(*body), content_type);
        }
        return execute(std::move(*req), std::move(token));
    }

    static coro::task<result<response>> failed(error err) {
        co_return std::unexpected(std::move(err));
    }

    static coro::task<result<response>> run(net::connector conn,
                                            std::shared_ptr<connection_pool> pool,
                                            client_config config,
                                            request req,
                                            coro::cancel_token token) {
        auto valid = req.validate();
        if (!valid) {
            co_return std::unexpected(std::move(valid.error()));
        }
        req.apply_framing();

        auto& hdrs = req.get_headers();
        if (!hdrs.contains("Host")) {
            hdrs.set("Host", req.get_url().authority());
        }
        if (!config.user_agent.empty() && !hdrs.contains("User-Agent")) {
            hdrs.set("User-Agent", config.user_agent);
        }
        if (!hdrs.contains("Connection")) {
            hdrs.set("Connection", "keep-alive");
        }

        const auto& dest = req.get_destination();
        auto prepared = std::make_shared<const prepared_request>(prepared_request{
            req.get_method(),
            req.serialize_head(),
            req.body(),
            dest.key(),
            !hdrs.keep_alive("1.1"),
        });

        RELAY_LOG_DEBUG("{} {}", method_to_string(prepared->m), req.get_url().to_string());

        if (auto pooled = pool->acquire(prepared->key)) {
            auto outcome = co_await exchange(std::move(pooled), prepared, pool,
                                             config.read_buffer_size, true, token);
            if (!outcome.stale) {
                co_return std::move(outcome.value);
            }
            RELAY_LOG_DEBUG("pooled connection to {} was stale ({}), reconnecting",
                            prepared->key, outcome.value.error());
        }

        if (token.is_cancelled()) {
            co_return fail(errc::cancelled, "request cancelled");
        }

        auto stream = co_await conn.connect(dest, token);
        if (!stream) {
            co_return std::unexpected(std::move(stream.error()));
        }

        auto outcome = co_await exchange(std::move(*stream), prepared, pool,
                                         config.read_buffer_size, false, token);
        co_return std::move(outcome.value);
    }

    /// Send one request on `stream` and read the response head
    static coro::task<exchange_outcome> exchange(std::unique_ptr<net::byte_stream> stream,
                                                 std::shared_ptr<const prepared_request> req,
                                                 std::weak_ptr<connection_pool> pool,
                                                 size_t read_buffer_size,
                                                 bool reused,
                                                 coro::cancel_token token) {
        response_head_parser parser;
        std::string buffer;
        bool received_any = false;
        std::optional<error> failure;
        {
            auto aborter = stream->aborter();
            auto reg = token.on_cancel([aborter] { aborter->abort(); });
            failure = co_await send_request(*stream, *req);
            if (!failure) {
                failure = co_await read_head(*stream, parser, buffer, received_any, read_buffer_size);
            }
        }

        if (token.is_cancelled()) {
            co_await stream->close();
            co_return exchange_outcome{fail(errc::cancelled, "request cancelled"), false};
        }
        if (failure) {
            co_await stream->close();
            bool stale = reused && !received_any && failure->is(errc::io);
            co_return exchange_outcome{std::unexpected(std::move(*failure)), stale};
        }

        auto decoder = body_decoder::for_response(req->m, parser.status_code(), parser.get_headers());
        bool keep_alive = !req->client_close
            && parser.status_code() != 101
            && decoder.get_framing() != body_decoder::framing::until_close
            && parser.get_headers().keep_alive(parser.version());

        RELAY_LOG_DEBUG("{} {} {} (keep-alive: {})", req->key, parser.status_code(),
                        parser.reason(), keep_alive);

        auto reader = std::make_shared<body_reader>(
            std::move(stream), std::move(decoder), std::move(buffer),
            body_reader::pool_return{std::move(pool), req->key, keep_alive},
            read_buffer_size);
        co_await reader->settle();

        co_return exchange_outcome{
            response(parser.status_code(), std::string(parser.reason()),
                     std::string(parser.version()), parser.get_headers(), std::move(reader)),
            false};
    }

    static coro::task<std::optional<error>> send_request(net::byte_stream& stream,
                                                         const prepared_request& req) {
        int rc = co_await stream.write_all(req.head);
        if (rc < 0) {
            co_return error(errc::io, "failed to send request", -rc);
        }
        if (req.body && !req.body->empty()) {
            rc = co_await stream.write_all(req.body->view());
            if (rc < 0) {
                co_return error(errc::io, "failed to send request body", -rc);
            }
        }
        co_return std::nullopt;
    }

    /// Read until a final (non-1xx) response head is parsed
    static coro::task<std::optional<error>> read_head(net::byte_stream& stream,
                                                      response_head_parser& parser,
                                                      std::string& buffer,
                                                      bool& received_any,
                                                      size_t read_buffer_size) {
        std::vector<char> chunk(read_buffer_size == 0 ? 8192 : read_buffer_size);
        while (true) {
            auto parsed = parser.parse(buffer);
            if (parsed == parse_result::error) {
                co_return error(errc::protocol, "malformed response head", 0,
                                std::string(parser.error_message()));
            }
            if (parsed == parse_result::complete) {
                auto code = parser.status_code();
                if (code >= 100 && code < 200 && code != 101) {
                    RELAY_LOG_DEBUG("skipping interim response {}", code);
                    parser.reset();
                    continue;
                }
                co_return std::nullopt;
            }

            auto res = co_await stream.read(chunk.data(), chunk.size());
            if (res.result < 0) {
                co_return error(errc::io, "failed to read response", -res.result);
            }
            if (res.result == 0) {
                if (!received_any) {
                    co_return error(errc::io, "connection closed before response");
                }
                co_return error(errc::protocol, "connection closed in response head");
            }
            received_any = true;
            buffer.append(chunk.data(), static_cast<size_t>(res.result));
        }
    }

    net::connector connector_;
    client_config config_;
    std::shared_ptr<connection_pool> pool_;
};

} // namespace relay::http
