#pragma once

#include <coroutine>
#include <exception>

namespace relay::coro {

/// Base class for all coroutine promise types
///
/// Holds the exception escaping the coroutine body and the links used by
/// final_awaiter: the awaiting coroutine (if any) and whether the task was
/// released to run on its own.
class promise_base {
public:
    promise_base() noexcept = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }

    std::coroutine_handle<> continuation_;
    bool detached_ = false;

private:
    std::exception_ptr exception_;
};

} // namespace relay::coro
