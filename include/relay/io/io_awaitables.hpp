#pragma once

#include "io_context.hpp"
#include <coroutine>
#include <cerrno>
#include <sys/socket.h>

namespace relay::io {

/// Awaitable for a single readiness-driven operation
///
/// Suspends until the backend has performed the operation. If the fd cannot
/// be registered the awaiter does not suspend and receives -errno.
class io_awaitable {
public:
    io_awaitable(io_context& ctx, io_op op, int fd, void* buffer = nullptr,
                 size_t length = 0, int flags = 0) noexcept
        : ctx_(ctx), op_(op), fd_(fd), buffer_(buffer), length_(length), flags_(flags) {}

    bool await_ready() const noexcept {
        return false;
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        io_request req{};
        req.op = op_;
        req.fd = fd_;
        req.buffer = buffer_;
        req.length = length_;
        req.socket_flags = flags_;
        req.awaiter = awaiter;

        if (!ctx_.prepare(req)) {
            result_ = io_result{-errno, 0};
            return false;
        }
        suspended_ = true;
        return true;
    }

    io_result await_resume() noexcept {
        if (suspended_) {
            result_ = io_context::get_last_result();
        }
        return result_;
    }

private:
    io_context& ctx_;
    io_op op_;
    int fd_;
    void* buffer_;
    size_t length_;
    int flags_;
    bool suspended_ = false;
    io_result result_{};
};

inline auto async_read(io_context& ctx, int fd, void* buffer, size_t length) {
    return io_awaitable(ctx, io_op::read, fd, buffer, length);
}

inline auto async_write(io_context& ctx, int fd, const void* buffer, size_t length) {
    return io_awaitable(ctx, io_op::write, fd, const_cast<void*>(buffer), length);
}

inline auto async_recv(io_context& ctx, int fd, void* buffer, size_t length, int flags = 0) {
    return io_awaitable(ctx, io_op::recv, fd, buffer, length, flags);
}

inline auto async_send(io_context& ctx, int fd, const void* buffer, size_t length, int flags = 0) {
    return io_awaitable(ctx, io_op::send, fd, const_cast<void*>(buffer), length, flags);
}

/// Wait for a non-blocking connect() in progress; result is 0 or -errno
inline auto async_connect_wait(io_context& ctx, int fd) {
    return io_awaitable(ctx, io_op::connect, fd);
}

} // namespace relay::io
