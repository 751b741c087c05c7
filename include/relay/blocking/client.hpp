#pragma once

#include <relay/blocking/context.hpp>
#include <relay/http/http_client.hpp>
#include <relay/http/http_message.hpp>
#include <relay/net/connector.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace relay::blocking {

struct client_options {
    size_t worker_threads = 1;                                    ///< Background worker threads
    http::client_config http;                                     ///< Engine configuration
    std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5);  ///< Teardown wait bound
};

namespace detail {

/// State shared by a client, its copies and every body it handed out
struct client_inner {
    client_inner(net::connector conn, const client_options& opts)
        : context(opts.worker_threads, opts.shutdown_grace)
        , engine(std::move(conn), opts.http) {}

    ~client_inner() {
        close();
    }

    /// Stop the context first so no task touches the pool while it is cleared
    void close() {
        context.close();
        engine.pool()->clear();
    }

    background_context context;
    http::client engine;
};

inline coro::task<result<std::string>> pull_chunk(std::shared_ptr<http::body_reader> reader,
                                                  coro::cancel_token token) {
    co_return co_await reader->next_chunk(std::move(token));
}

} // namespace detail

/// Synchronous cursor over a response body
///
/// Each read that needs data runs one pull on the background context and
/// blocks until the next chunk, the end of the body, or an error. After an
/// error the cursor is finished and further reads return 0. A body keeps
/// its client's context alive until it is dropped, but reads fail with
/// errc::closed once the client has been closed explicitly.
class body {
public:
    body(std::shared_ptr<detail::client_inner> inner, std::shared_ptr<http::body_reader> reader)
        : inner_(std::move(inner)), reader_(std::move(reader)) {}

    body(body&&) noexcept = default;
    body& operator=(body&&) noexcept = default;
    body(const body&) = delete;
    body& operator=(const body&) = delete;

    /// Bytes copied into `buffer`; 0 at the end of the body
    result<size_t> read(void* buffer, size_t length) {
        if (length == 0 || finished_) {
            return 0;
        }
        if (!inner_ || inner_->context.is_closed()) {
            finished_ = true;
            pending_.clear();
            return fail(errc::closed, "client is closed");
        }

        if (offset_ >= pending_.size()) {
            auto chunk = inner_->context.run<std::string>(
                [reader = reader_](coro::cancel_token token) {
                    return detail::pull_chunk(reader, std::move(token));
                });
            if (!chunk) {
                finished_ = true;
                return std::unexpected(std::move(chunk.error()));
            }
            if (chunk->empty()) {
                finished_ = true;
                return 0;
            }
            pending_ = std::move(*chunk);
            offset_ = 0;
        }

        size_t n = std::min(length, pending_.size() - offset_);
        std::memcpy(buffer, pending_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    result<size_t> read(std::span<char> buffer) {
        return read(buffer.data(), buffer.size());
    }

    result<size_t> read(std::span<std::byte> buffer) {
        return read(buffer.data(), buffer.size());
    }

    /// Read everything that is left
    result<std::string> read_to_string() {
        std::string out;
        char buf[8192];
        while (true) {
            auto n = read(buf, sizeof(buf));
            if (!n) {
                return std::unexpected(std::move(n.error()));
            }
            if (*n == 0) {
                return out;
            }
            out.append(buf, *n);
        }
    }

    bool is_finished() const noexcept { return finished_; }

private:
    std::shared_ptr<detail::client_inner> inner_;
    std::shared_ptr<http::body_reader> reader_;
    std::string pending_;
    size_t offset_ = 0;
    bool finished_ = false;
};

/// Response returned by the blocking client
class response {
public:
    response(http::response resp, std::shared_ptr<detail::client_inner> inner)
        : status_(resp.status_code())
        , reason_(resp.reason())
        , version_(resp.version())
        , headers_(resp.get_headers())
        , body_(std::move(inner), resp.body_ptr()) {}

    uint16_t status_code() const noexcept { return status_; }
    std::string_view reason() const noexcept { return reason_; }
    std::string_view version() const noexcept { return version_; }
    bool is_success() const noexcept { return status_ >= 200 && status_ < 300; }

    const http::headers& get_headers() const noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }

    blocking::body& body() noexcept { return body_; }

private:
    uint16_t status_;
    std::string reason_;
    std::string version_;
    http::headers headers_;
    blocking::body body_;
};

/// A request running on the background context
///
/// wait() hands out the result once. Dropping the handle (or cancel())
/// before the request completes cancels it and closes its connection.
class pending_call {
public:
    pending_call(detail::pending<http::response> p, std::shared_ptr<detail::client_inner> inner)
        : pending_(std::move(p)), inner_(std::move(inner)) {}

    result<response> wait() {
        return wrap(pending_.wait());
    }

    /// std::nullopt if the call did not finish within `timeout`; the call
    /// keeps running and may be waited for again or dropped
    template<typename Rep, typename Period>
    std::optional<result<response>> wait_for(std::chrono::duration<Rep, Period> timeout) {
        auto r = pending_.wait_for(timeout);
        if (!r) {
            return std::nullopt;
        }
        return wrap(std::move(*r));
    }

    bool is_ready() const { return pending_.is_ready(); }

    void cancel() { pending_.cancel(); }

private:
    result<response> wrap(result<http::response> r) {
        if (!r) {
            return std::unexpected(std::move(r.error()));
        }
        return response(std::move(*r), inner_);
    }

    detail::pending<http::response> pending_;
    std::shared_ptr<detail::client_inner> inner_;
};

/// Synchronous HTTP client
///
/// Owns a background context whose workers run the async engine. Any
/// number of threads may call execute() at once; each blocks only for its
/// own request. Copies share the context, which is torn down by close() or
/// when the last copy and the last body are gone.
///
/// @code
/// blocking::client c(net::connector(tls::openssl_provider::create().value()));
/// auto resp = c.get("https://example.com/");
/// if (resp) {
///     auto text = resp->body().read_to_string();
/// }
/// @endcode
class client {
public:
    /// Throws relay::exception (errc::runtime_init) if the context cannot start
    explicit client(net::connector conn = net::connector{}, client_options opts = {})
        : inner_(std::make_shared<detail::client_inner>(std::move(conn), opts)) {}

    static result<client> create(net::connector conn = net::connector{}, client_options opts = {}) {
        try {
            return client(std::move(conn), std::move(opts));
        } catch (const exception& e) {
            return std::unexpected(e.get_error());
        }
    }

    result<pending_call> submit(http::request req) {
        auto inner = inner_;
        auto p = inner->context.submit<http::response>(
            [engine = &inner->engine, req = std::move(req)](coro::cancel_token token) mutable {
                return engine->execute(std::move(req), std::move(token));
            });
        if (!p) {
            return std::unexpected(std::move(p.error()));
        }
        return pending_call(std::move(*p), std::move(inner));
    }

    result<response> execute(http::request req) {
        auto call = submit(std::move(req));
        if (!call) {
            return std::unexpected(std::move(call.error()));
        }
        return call->wait();
    }

    result<response> get(std::string_view url) { return send(http::method::GET, url); }
    result<response> head(std::string_view url) { return send(http::method::HEAD, url); }
    result<response> del(std::string_view url) { return send(http::method::DELETE_, url); }

    result<response> post(std::string_view url, http::shared_body body,
                          std::string_view content_type = http::mime::application_octet_stream) {
        return send(http::method::POST, url, std::move(body), content_type);
    }

    result<response> put(std::string_view url, http::shared_body body,
                         std::string_view content_type = http::mime::application_octet_stream) {
        return send(http::method::PUT, url, std::move(body), content_type);
    }

    result<response> patch(std::string_view url, http::shared_body body,
                           std::string_view content_type = http::mime::application_octet_stream) {
        return send(http::method::PATCH, url, std::move(body), content_type);
    }

    /// Cancel in-flight calls, release pooled connections and join the
    /// workers. Idempotent; bodies handed out earlier fail with errc::closed.
    void close() { inner_->close(); }

    bool is_closed() const { return inner_->context.is_closed(); }

    const http::client& engine() const noexcept { return inner_->engine; }
    const background_context& context() const noexcept { return inner_->context; }

private:
    result<response> send(http::method m, std::string_view url,
                          std::optional<http::shared_body> body = std::nullopt,
                          std::string_view content_type = {}) {
        auto req = http::request::make(m, url);
        if (!req) {
            return std::unexpected(std::move(req.error()));
        }
        if (body) {
            req->set_body(std::move(*body), content_type);
        }
        return execute(std::move(*req));
    }

    std::shared_ptr<detail::client_inner> inner_;
};

} // namespace relay::blocking
