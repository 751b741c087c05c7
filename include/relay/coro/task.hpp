#pragma once

#include "promise_base.hpp"
#include <coroutine>
#include <optional>
#include <exception>
#include <utility>
#include <type_traits>
#include <atomic>
#include <memory>
#include <variant>

namespace relay::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace relay::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.continuation_) {
            return promise.continuation_;
        }
        if (promise.detached_) {
            // Nobody owns a released task; it frees itself
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// Result slot shared between a spawned task and its join_handle
template<typename T>
struct join_state {
    using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::optional<value_type> value_;
    std::exception_ptr exception_;
    std::atomic<void*> waiter_{nullptr};
    std::atomic<bool> completed_{false};

    void set_value(value_type value) {
        value_.emplace(std::move(value));
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        exception_ = ex;
        complete();
    }

    void complete() {
        completed_.store(true, std::memory_order_release);
        void* waiter_addr = waiter_.exchange(nullptr, std::memory_order_acq_rel);
        if (waiter_addr) {
            runtime::schedule_handle(std::coroutine_handle<>::from_address(waiter_addr));
        }
    }

    [[nodiscard]] bool is_completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    /// Returns true if the waiter was parked, false if the result is already in
    bool set_waiter(std::coroutine_handle<> h) noexcept {
        void* expected = nullptr;
        if (!waiter_.compare_exchange_strong(expected, h.address(),
                std::memory_order_acq_rel, std::memory_order_acquire)) {
            return false;
        }
        if (completed_.load(std::memory_order_acquire)) {
            // Completion raced with parking; whoever takes the waiter back resumes it
            void* addr = waiter_.exchange(nullptr, std::memory_order_acq_rel);
            return addr == nullptr;
        }
        return true;
    }

    T take() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*value_);
        }
    }
};

} // namespace detail

/// Awaitable result of task<T>::spawn()
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;

    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return state_->is_completed();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        return state_->set_waiter(awaiter);
    }

    T await_resume() {
        return state_->take();
    }

    [[nodiscard]] bool is_ready() const noexcept {
        return state_->is_completed();
    }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

namespace detail {

template<typename T>
struct value_promise : promise_base {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }

    T take_value() {
        rethrow_if_failed();
        return std::move(*value_);
    }
};

struct void_promise : promise_base {
    void return_void() noexcept {}

    void take_value() {
        rethrow_if_failed();
    }
};

} // namespace detail

/// Lazily started coroutine producing a T
///
/// A task does nothing until it is awaited, spawned, or released to a
/// scheduler. Awaiting transfers control straight into the task and resumes
/// the awaiter when it finishes; exceptions propagate to the awaiter.
template<typename T>
class task {
public:
    struct promise_type
        : std::conditional_t<std::is_void_v<T>, detail::void_promise, detail::value_promise<T>> {
        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the coroutine frees itself when it finishes
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current worker
    void go() {
        runtime::schedule_handle(release());
    }

    /// Start the task and return a handle to await its result
    [[nodiscard]] join_handle<T> spawn();

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        return handle_.promise().take_value();
    }

private:
    handle_type handle_;
};

namespace detail {

template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value(std::monostate{});
        } else {
            state->set_value(co_await std::move(t));
        }
    } catch (...) {
        state->set_exception(std::current_exception());
    }
}

} // namespace detail

template<typename T>
join_handle<T> task<T>::spawn() {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go();
    return join_handle<T>(std::move(state));
}

} // namespace relay::coro
