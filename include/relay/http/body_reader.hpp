#pragma once

#include <relay/http/connection_pool.hpp>
#include <relay/http/http_parser.hpp>
#include <relay/net/byte_stream.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay::http {

/// Streams a response body off its connection
///
/// When the body ends cleanly on a keep-alive connection the stream goes
/// back to the pool it came from; otherwise the stream is closed. Only one
/// coroutine may read at a time, and the reader must stay alive until that
/// read completes.
class body_reader {
public:
    /// Where the connection goes once the body is done
    struct pool_return {
        std::weak_ptr<connection_pool> pool;
        std::string key;
        bool keep_alive = false;
    };

    body_reader(std::unique_ptr<net::byte_stream> stream, body_decoder decoder,
                std::string buffered, pool_return ret, size_t read_buffer_size = 8192)
        : stream_(std::move(stream))
        , decoder_(std::move(decoder))
        , buffer_(std::move(buffered))
        , return_(std::move(ret))
        , read_buffer_(read_buffer_size == 0 ? 8192 : read_buffer_size) {}

    body_reader(const body_reader&) = delete;
    body_reader& operator=(const body_reader&) = delete;

    /// Next non-empty piece of the body; an empty string marks the end
    coro::task<result<std::string>> next_chunk(coro::cancel_token token = {}) {
        if (error_) {
            co_return std::unexpected(*error_);
        }
        if (done_) {
            co_return std::string{};
        }

        std::string out;
        while (true) {
            auto parsed = decoder_.decode(buffer_, out);
            if (parsed == parse_result::error) {
                co_return co_await fail_with(error(errc::protocol, "malformed response body", 0,
                                                   std::string(decoder_.error_message())));
            }
            if (parsed == parse_result::complete) {
                co_await finish(true);
                co_return out;
            }
            if (!out.empty()) {
                co_return out;
            }

            if (token.is_cancelled()) {
                co_return co_await fail_with(error(errc::cancelled, "body read cancelled"));
            }

            io::io_result res{};
            {
                auto aborter = stream_->aborter();
                auto reg = token.on_cancel([aborter] { aborter->abort(); });
                res = co_await stream_->read(read_buffer_.data(), read_buffer_.size());
            }

            if (token.is_cancelled()) {
                co_return co_await fail_with(error(errc::cancelled, "body read cancelled"));
            }
            if (res.result < 0) {
                co_return co_await fail_with(error(errc::io, "failed to read response body", -res.result));
            }
            if (res.result == 0) {
                if (decoder_.finish() == parse_result::complete) {
                    // Delimited by close: nothing to reuse
                    co_await finish(false);
                    co_return out;
                }
                co_return co_await fail_with(error(errc::protocol, "response body truncated", 0,
                                                   std::string(decoder_.error_message())));
            }
            buffer_.append(read_buffer_.data(), static_cast<size_t>(res.result));
        }
    }

    /// Collect the rest of the body
    coro::task<result<std::string>> read_all(coro::cancel_token token = {}) {
        std::string body;
        while (true) {
            auto chunk = co_await next_chunk(token);
            if (!chunk) {
                co_return std::unexpected(std::move(chunk.error()));
            }
            if (chunk->empty()) {
                co_return body;
            }
            body += *chunk;
        }
    }

    /// Hand the connection back right away if the response has no body
    coro::task<void> settle() {
        if (!done_ && !error_ && decoder_.is_done()) {
            co_await finish(true);
        }
    }

    bool is_done() const noexcept { return done_; }
    bool has_error() const noexcept { return error_.has_value(); }

private:
    coro::task<void> finish(bool reusable) {
        done_ = true;
        auto pool = return_.pool.lock();
        if (reusable && return_.keep_alive && buffer_.empty() && pool && stream_) {
            if (pool->release(return_.key, std::move(stream_))) {
                RELAY_LOG_DEBUG("connection to {} returned to pool", return_.key);
                co_return;
            }
        }
        if (stream_) {
            co_await stream_->close();
            stream_.reset();
        }
    }

    coro::task<result<std::string>> fail_with(error err) {
        error_ = err;
        done_ = true;
        if (stream_) {
            co_await stream_->close();
            stream_.reset();
        }
        co_return std::unexpected(std::move(err));
    }

    std::unique_ptr<net::byte_stream> stream_;
    body_decoder decoder_;
    std::string buffer_;
    pool_return return_;
    std::vector<char> read_buffer_;
    bool done_ = false;
    std::optional<error> error_;
};

} // namespace relay::http
