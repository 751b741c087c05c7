#pragma once

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <sys/socket.h>

namespace relay::io {

/// I/O operation types
enum class io_op : uint8_t {
    none = 0,
    read,
    write,
    recv,
    send,
    connect       ///< Wait for a non-blocking connect() to finish
};

/// I/O operation result
struct io_result {
    int32_t result;      ///< Bytes transferred or error code (negative = -errno)
    uint32_t flags;

    bool success() const noexcept {
        return result >= 0;
    }

    int bytes_transferred() const noexcept {
        return result >= 0 ? result : 0;
    }

    int error_code() const noexcept {
        return result < 0 ? -result : 0;
    }
};

/// I/O operation request
struct io_request {
    io_op op;
    int fd;
    void* buffer;
    size_t length;
    std::coroutine_handle<> awaiter;    ///< Resumed once the operation completes
    int socket_flags;
};

/// Readiness-based I/O backend
///
/// A backend is owned by one worker thread. prepare() and poll() must be
/// called from that thread; notify() may be called from any thread.
class io_backend {
public:
    virtual ~io_backend() = default;

    /// Register an operation; false (with errno set) if the fd cannot be watched
    virtual bool prepare(const io_request& req) = 0;

    /// Run ready operations and resume their awaiters
    /// @param timeout Maximum time to wait (negative blocks until woken)
    /// @return Number of completions processed
    virtual int poll(std::chrono::milliseconds timeout) = 0;

    virtual bool has_pending() const noexcept = 0;

    virtual size_t pending_count() const noexcept = 0;

    /// Interrupt a blocking poll() from another thread
    virtual void notify() noexcept = 0;
};

} // namespace relay::io
