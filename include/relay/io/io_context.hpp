#pragma once

#include "io_backend.hpp"
#include "epoll_backend.hpp"
#include <memory>
#include <chrono>

namespace relay::io {

/// Per-thread I/O context
///
/// Each scheduler worker owns one. Code running outside a worker uses
/// default_io_context() and must poll it itself.
class io_context {
public:
    io_context()
        : backend_(std::make_unique<epoll_backend>()) {}

    explicit io_context(std::unique_ptr<io_backend> backend)
        : backend_(std::move(backend)) {}

    io_context(const io_context&) = delete;
    io_context& operator=(const io_context&) = delete;

    bool prepare(const io_request& req) {
        return backend_->prepare(req);
    }

    int poll(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
        return backend_->poll(timeout);
    }

    bool has_pending() const noexcept {
        return backend_->has_pending();
    }

    size_t pending_count() const noexcept {
        return backend_->pending_count();
    }

    /// Wake a thread blocked in poll(); safe from any thread
    void notify() noexcept {
        backend_->notify();
    }

    static io_result get_last_result() noexcept {
        return epoll_backend::get_last_result();
    }

    io_backend* get_backend() noexcept {
        return backend_.get();
    }

private:
    std::unique_ptr<io_backend> backend_;
};

/// Context for code running outside any scheduler worker
inline io_context& default_io_context() {
    static io_context instance;
    return instance;
}

} // namespace relay::io
