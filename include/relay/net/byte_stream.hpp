#pragma once

#include <relay/io/io_backend.hpp>
#include <relay/coro/task.hpp>

#include <cerrno>
#include <memory>
#include <string_view>

namespace relay::net {

/// Interrupts a stream from any thread
///
/// After abort() every pending and future read or write on the stream
/// fails or reports end of stream. Used by cancellation.
class abort_handle {
public:
    virtual ~abort_handle() = default;
    virtual void abort() noexcept = 0;
};

/// Duplex byte channel carrying HTTP traffic: raw TCP, TLS, or a test double
///
/// A stream is driven by one coroutine at a time. Results follow io_result:
/// bytes transferred, 0 for end of stream, or -errno.
class byte_stream {
public:
    virtual ~byte_stream() = default;

    virtual coro::task<io::io_result> read(void* buffer, size_t length) = 0;

    virtual coro::task<io::io_result> write(const void* buffer, size_t length) = 0;

    /// Orderly close; the stream is unusable afterwards
    virtual coro::task<void> close() = 0;

    /// Handle that can abort this stream from another thread
    virtual std::shared_ptr<abort_handle> aborter() = 0;

    /// Write the whole buffer
    /// @return 0 once every byte is written, otherwise the first -errno
    coro::task<int> write_all(std::string_view data) {
        while (!data.empty()) {
            auto res = co_await write(data.data(), data.size());
            if (res.result < 0) {
                co_return res.result;
            }
            if (res.result == 0) {
                co_return -EPIPE;
            }
            data.remove_prefix(static_cast<size_t>(res.result));
        }
        co_return 0;
    }
};

} // namespace relay::net
