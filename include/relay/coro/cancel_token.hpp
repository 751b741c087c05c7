#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace relay::coro {

/// Outcome of a wait that a token can cut short
enum class cancel_result {
    completed,
    cancelled
};

namespace detail {

/// Shared cancellation state
///
/// Callbacks run on the thread that calls trigger(), one at a time and
/// outside the lock. Removing a callback that is currently running on
/// another thread blocks until it returns, so whatever the callback
/// touches may be destroyed once remove_callback() comes back.
struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable callback_done;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;
    uint64_t running_id = 0;
    std::thread::id running_thread;

    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = std::find_if(callbacks.begin(), callbacks.end(),
            [id](const auto& entry) { return entry.first == id; });
        if (it != callbacks.end()) {
            callbacks.erase(it);
            return;
        }
        if (running_id == id && running_thread != std::this_thread::get_id()) {
            callback_done.wait(lock, [this, id] { return running_id != id; });
        }
    }

    void trigger() {
        std::unique_lock<std::mutex> lock(mutex);
        if (cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        running_thread = std::this_thread::get_id();
        while (!callbacks.empty()) {
            auto entry = std::move(callbacks.front());
            callbacks.erase(callbacks.begin());
            running_id = entry.first;
            lock.unlock();
            entry.second();
            lock.lock();
            running_id = 0;
            callback_done.notify_all();
        }
    }
};

} // namespace detail

/// Keeps a cancel callback registered for as long as it lives
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
            id_ = 0;
        }
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// Observer side of a cancel_source
///
/// A default-constructed token is never cancelled. Tokens are cheap to copy
/// and are passed by value into coroutines.
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// True while cancellation has NOT been requested
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Run `callback` when cancellation is requested (immediately if it already was)
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner side: hands out tokens and requests cancellation
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    void cancel() {
        state_->trigger();
    }

    bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

} // namespace relay::coro
