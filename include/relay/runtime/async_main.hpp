#pragma once

#include "scheduler.hpp"
#include <relay/coro/task.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

namespace relay::runtime {

/// One-shot value handoff from a coroutine to a blocked thread
///
/// The first set_value()/set_exception() wins; later ones are ignored and
/// return false. Shared between the producer task and the waiting thread
/// through a shared_ptr.
template<typename T>
class completion_signal {
public:
    bool set_value(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) return false;
        result_.emplace(std::move(value));
        completed_ = true;
        cv_.notify_all();
        return true;
    }

    bool set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) return false;
        exception_ = e;
        completed_ = true;
        cv_.notify_all();
        return true;
    }

    [[nodiscard]] bool is_completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    /// Block until completed, then hand out the value (once)
    T wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return completed_; });
        return take();
    }

    /// Like wait(), but gives up after `timeout`
    template<typename Rep, typename Period>
    std::optional<T> wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return completed_; })) {
            return std::nullopt;
        }
        return take();
    }

private:
    T take() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        return std::move(*result_);
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> result_;
    std::exception_ptr exception_;
    bool completed_ = false;
};

namespace detail {

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner,
                                    std::shared_ptr<completion_signal<T>> signal) {
    try {
        signal->set_value(co_await std::move(inner));
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

inline coro::task<void> completion_wrapper(coro::task<void> inner,
                                           std::shared_ptr<completion_signal<bool>> signal) {
    try {
        co_await std::move(inner);
        signal->set_value(true);
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

} // namespace detail

struct run_config {
    /// Number of worker threads (0 = hardware concurrency)
    size_t num_threads = 0;
};

/// Run a task on a temporary scheduler and block until it finishes
///
/// @code
/// relay::coro::task<int> async_main() { co_return 42; }
/// int main() { return relay::run(async_main()); }
/// @endcode
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    size_t threads = config.num_threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }

    scheduler sched(threads);
    sched.start();

    if constexpr (std::is_void_v<T>) {
        auto signal = std::make_shared<completion_signal<bool>>();
        sched.spawn(detail::completion_wrapper(std::move(task), signal).release());
        signal->wait();
        sched.shutdown();
    } else {
        auto signal = std::make_shared<completion_signal<T>>();
        sched.spawn(detail::completion_wrapper(std::move(task), signal).release());
        T result = signal->wait();
        sched.shutdown();
        return result;
    }
}

template<typename T>
T run(coro::task<T> task, size_t num_threads) {
    return run(std::move(task), run_config{.num_threads = num_threads});
}

} // namespace relay::runtime

namespace relay {

using runtime::run;
using runtime::run_config;

} // namespace relay
