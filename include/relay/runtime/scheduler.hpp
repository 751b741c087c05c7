#pragma once

#include "worker_thread.hpp"
#include <relay/log/macros.hpp>
#include <vector>
#include <memory>
#include <atomic>
#include <coroutine>
#include <thread>

namespace relay::runtime {

/// Fixed-size pool of workers, each with its own io_context
///
/// Handles submitted from outside are spread round-robin. A coroutine
/// resumed by I/O keeps running on the worker whose io_context completed
/// the operation.
class scheduler {
    friend class worker_thread;

public:
    /// May throw std::runtime_error if an io_context cannot be created
    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads)
        , running_(false)
        , spawn_index_(0) {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.push_back(std::make_unique<worker_thread>(this, i));
        }
    }

    ~scheduler() {
        shutdown();
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    /// Start the worker threads; throws std::system_error if a thread cannot start
    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        try {
            for (auto& worker : workers_) {
                worker->start();
            }
        } catch (...) {
            shutdown();
            throw;
        }
        RELAY_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    /// Stop and join all workers, then drop queued coroutines
    void shutdown() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }

        for (auto& worker : workers_) {
            worker->stop();
        }
        for (auto& worker : workers_) {
            worker->drain_remaining_tasks();
        }
        RELAY_LOG_DEBUG("scheduler stopped");
    }

    /// Queue a coroutine on some worker. If the scheduler is not running
    /// the handle is destroyed.
    void spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        if (!running_.load(std::memory_order_acquire)) [[unlikely]] {
            handle.destroy();
            return;
        }
        size_t index = spawn_index_.fetch_add(1, std::memory_order_relaxed) % num_threads_;
        workers_[index]->schedule(handle);
    }

    [[nodiscard]] size_t num_threads() const noexcept {
        return num_threads_;
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] worker_thread* get_worker(size_t index) noexcept {
        return index < workers_.size() ? workers_[index].get() : nullptr;
    }

    /// True if the calling thread is one of this scheduler's workers
    [[nodiscard]] bool owns_current_thread() const noexcept {
        return current_scheduler_ == this;
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        size_t total = 0;
        for (const auto& worker : workers_) {
            total += worker->tasks_executed();
        }
        return total;
    }

    /// The scheduler whose worker is running on the calling thread, or nullptr
    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

private:
    std::vector<std::unique_ptr<worker_thread>> workers_;
    size_t num_threads_;
    std::atomic<bool> running_;
    std::atomic<size_t> spawn_index_;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// io_context of the calling worker, or the default context off-worker
inline io::io_context& current_io_context() {
    if (auto* worker = worker_thread::current()) {
        return worker->io_context();
    }
    return io::default_io_context();
}

/// Make `handle` runnable again
///
/// On a worker the handle goes to that worker's local queue; elsewhere it
/// is resumed inline.
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) return;
    if (auto* worker = worker_thread::current()) {
        worker->schedule(handle);
    } else if (!handle.done()) {
        handle.resume();
    }
}

inline void worker_thread::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    try {
        thread_ = std::thread(&worker_thread::run, this);
    } catch (...) {
        running_.store(false, std::memory_order_release);
        throw;
    }
}

inline void worker_thread::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false,
            std::memory_order_acq_rel, std::memory_order_relaxed)) return;
    wake();
    if (thread_.joinable()) thread_.join();
}

inline void worker_thread::drain_remaining_tasks() noexcept {
    drain_inbox();
    // A queued handle may be a child frame still owned by its parent task,
    // so it is dropped rather than destroyed.
    if (!queue_.empty()) {
        RELAY_LOG_WARNING("worker {} dropped {} unfinished coroutines", worker_id_, queue_.size());
        queue_.clear();
    }
}

inline void worker_thread::run() {
    scheduler::current_scheduler_ = scheduler_;
    current_worker_ = this;

    while (running_.load(std::memory_order_acquire)) {
        drain_inbox();

        if (!queue_.empty()) {
            // Run what is ready now; anything queued meanwhile waits for
            // the next round so I/O gets polled in between.
            size_t batch = queue_.size();
            for (size_t i = 0; i < batch && !queue_.empty(); ++i) {
                auto handle = queue_.front();
                queue_.pop_front();
                if (!handle.done()) {
                    handle.resume();
                    tasks_executed_.fetch_add(1, std::memory_order_relaxed);
                }
            }
            io_context_->poll(std::chrono::milliseconds(0));
            continue;
        }

        idle_.store(true, std::memory_order_seq_cst);
        if (inbox_empty() && running_.load(std::memory_order_acquire)) {
            io_context_->poll(idle_poll_interval);
        }
        idle_.store(false, std::memory_order_relaxed);
    }

    scheduler::current_scheduler_ = nullptr;
    current_worker_ = nullptr;
}

} // namespace relay::runtime
