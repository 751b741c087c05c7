#pragma once

#include <relay/io/io_context.hpp>
#include <coroutine>
#include <thread>
#include <atomic>
#include <mutex>
#include <deque>
#include <vector>
#include <chrono>
#include <memory>

namespace relay::runtime {

class scheduler;

/// Worker thread that runs coroutines and drives its own io_context
///
/// Two queues:
/// - a local deque touched only by the worker itself
/// - a mutex-guarded inbox for handles submitted from other threads
///
/// An idle worker blocks inside its io_context's poll(); submitting to the
/// inbox wakes it through the backend's notify().
class worker_thread {
public:
    /// Upper bound on one idle wait; a safety net, wake-ups come from notify()
    static constexpr std::chrono::milliseconds idle_poll_interval{100};

    worker_thread(scheduler* sched, size_t worker_id)
        : scheduler_(sched)
        , worker_id_(worker_id)
        , running_(false)
        , tasks_executed_(0)
        , io_context_(std::make_unique<io::io_context>()) {}

    ~worker_thread() {
        stop();
    }

    worker_thread(const worker_thread&) = delete;
    worker_thread& operator=(const worker_thread&) = delete;
    worker_thread(worker_thread&&) = delete;
    worker_thread& operator=(worker_thread&&) = delete;

    void start();
    void stop();

    /// Discard whatever is still queued; only after the thread has stopped
    void drain_remaining_tasks() noexcept;

    /// Queue a handle; safe from any thread
    void schedule(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;

        if (current_worker_ == this) {
            queue_.push_back(handle);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.push_back(handle);
        }
        if (idle_.load(std::memory_order_seq_cst)) {
            wake();
        }
    }

    void wake() noexcept {
        io_context_->notify();
    }

    [[nodiscard]] size_t tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t worker_id() const noexcept {
        return worker_id_;
    }

    [[nodiscard]] std::thread::id thread_id() const noexcept {
        return thread_.get_id();
    }

    [[nodiscard]] io::io_context& io_context() noexcept {
        return *io_context_;
    }

    /// The worker running on the calling thread, or nullptr
    [[nodiscard]] static worker_thread* current() noexcept {
        return current_worker_;
    }

private:
    void run();

    bool drain_inbox() {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (inbox_.empty()) return false;
        for (auto h : inbox_) {
            queue_.push_back(h);
        }
        inbox_.clear();
        return true;
    }

    bool inbox_empty() {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        return inbox_.empty();
    }

    scheduler* scheduler_;
    size_t worker_id_;
    std::deque<std::coroutine_handle<>> queue_;
    std::mutex inbox_mutex_;
    std::vector<std::coroutine_handle<>> inbox_;
    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<size_t> tasks_executed_;
    std::atomic<bool> idle_{false};
    std::unique_ptr<io::io_context> io_context_;

    static inline thread_local worker_thread* current_worker_ = nullptr;
};

} // namespace relay::runtime
