#pragma once

#include <relay/runtime/scheduler.hpp>
#include <coroutine>
#include <atomic>
#include <mutex>
#include <vector>

namespace relay::sync {

/// Manual-reset event for coroutines
///
/// set() may be called from any thread, including threads that are not
/// workers. Each waiter is resumed on the worker it suspended on, never on
/// the thread calling set().
class event {
public:
    event() = default;

    event(const event&) = delete;
    event& operator=(const event&) = delete;

    class wait_awaitable {
    public:
        explicit wait_awaitable(event& e) : event_(e) {}

        bool await_ready() const noexcept {
            return event_.signaled_.load(std::memory_order_acquire);
        }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            std::lock_guard<std::mutex> guard(event_.mutex_);
            if (event_.signaled_.load(std::memory_order_relaxed)) {
                return false;
            }
            event_.waiters_.push_back({awaiter, runtime::worker_thread::current()});
            return true;
        }

        void await_resume() const noexcept {}

    private:
        event& event_;
    };

    auto wait() {
        return wait_awaitable(*this);
    }

    /// Signal the event and wake all waiters
    void set() {
        std::vector<waiter> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            signaled_.store(true, std::memory_order_release);
            to_resume.swap(waiters_);
        }

        for (auto& w : to_resume) {
            if (w.worker) {
                w.worker->schedule(w.handle);
            } else {
                runtime::schedule_handle(w.handle);
            }
        }
    }

    void reset() {
        signaled_.store(false, std::memory_order_release);
    }

    bool is_set() const noexcept {
        return signaled_.load(std::memory_order_acquire);
    }

private:
    struct waiter {
        std::coroutine_handle<> handle;
        runtime::worker_thread* worker;
    };

    std::mutex mutex_;
    std::atomic<bool> signaled_{false};
    std::vector<waiter> waiters_;
};

} // namespace relay::sync
