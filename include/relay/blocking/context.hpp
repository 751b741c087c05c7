#pragma once

#include <relay/runtime/scheduler.hpp>
#include <relay/runtime/async_main.hpp>
#include <relay/coro/task.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace relay::blocking {

namespace detail {

/// One submission, seen from the context's side
struct call_base {
    virtual ~call_base() = default;
    /// Complete the call with errc::closed unless it already has a result
    virtual void fail_closed() = 0;
    virtual void cancel() = 0;
};

template<typename T>
struct call : call_base {
    runtime::completion_signal<result<T>> signal;
    coro::cancel_source source;

    void fail_closed() override {
        signal.set_value(fail(errc::closed, "client closed while the call was in flight"));
    }

    void cancel() override {
        source.cancel();
    }
};

/// Blocking side of one submission; the result can be taken once
template<typename T>
class pending {
public:
    explicit pending(std::shared_ptr<call<T>> c) : call_(std::move(c)) {}

    pending(pending&&) noexcept = default;
    pending& operator=(pending&& other) noexcept {
        if (this != &other) {
            abandon();
            call_ = std::move(other.call_);
            consumed_ = other.consumed_;
        }
        return *this;
    }

    /// Dropping an unfinished call cancels its task
    ~pending() { abandon(); }

    pending(const pending&) = delete;
    pending& operator=(const pending&) = delete;

    result<T> wait() {
        if (!call_ || consumed_) {
            return fail(errc::closed, "call already consumed");
        }
        consumed_ = true;
        return call_->signal.wait();
    }

    template<typename Rep, typename Period>
    std::optional<result<T>> wait_for(std::chrono::duration<Rep, Period> timeout) {
        if (!call_ || consumed_) {
            return result<T>(fail(errc::closed, "call already consumed"));
        }
        auto r = call_->signal.wait_for(timeout);
        if (r) {
            consumed_ = true;
        }
        return r;
    }

    bool is_ready() const { return call_ && call_->signal.is_completed(); }

    void cancel() {
        if (call_) call_->cancel();
    }

private:
    void abandon() {
        if (call_ && !consumed_ && !call_->signal.is_completed()) {
            call_->cancel();
        }
    }

    std::shared_ptr<call<T>> call_;
    bool consumed_ = false;
};

} // namespace detail

/// Owned scheduler that runs async work for synchronous callers
///
/// Each submission gets a completion signal and a cancel source. close()
/// rejects new work, completes every in-flight call with errc::closed,
/// cancels their tasks, waits up to the shutdown grace for them to unwind
/// and then joins the workers. Must not be closed or destroyed from one of
/// its own worker threads.
class background_context {
public:
    /// Throws relay::exception (errc::runtime_init) if the workers cannot start
    background_context(size_t worker_threads, std::chrono::milliseconds shutdown_grace)
        : grace_(shutdown_grace) {
        try {
            scheduler_ = std::make_unique<runtime::scheduler>(worker_threads == 0 ? 1 : worker_threads);
            scheduler_->start();
        } catch (const std::exception& e) {
            RELAY_LOG_ERROR("failed to start background context: {}", e.what());
            throw exception(error(errc::runtime_init, "failed to start background context", 0, e.what()));
        }
        RELAY_LOG_DEBUG("background context started ({} workers)", scheduler_->num_threads());
    }

    ~background_context() {
        close();
    }

    background_context(const background_context&) = delete;
    background_context& operator=(const background_context&) = delete;

    /// Run `factory(token)` on a worker; `factory` must return task<result<T>>
    template<typename T, typename Factory>
    result<detail::pending<T>> submit(Factory&& factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return fail(errc::closed, "client is closed");
        }
        auto c = std::make_shared<detail::call<T>>();
        coro::task<result<T>> work = factory(c->source.get_token());
        calls_.emplace(c.get(), c);
        scheduler_->spawn(drive<T>(this, c, std::move(work)).release());
        return detail::pending<T>(std::move(c));
    }

    /// Submit and block until the result is ready
    template<typename T, typename Factory>
    result<T> run(Factory&& factory) {
        auto p = submit<T>(std::forward<Factory>(factory));
        if (!p) {
            return std::unexpected(std::move(p.error()));
        }
        return p->wait();
    }

    void close() {
        std::vector<std::shared_ptr<detail::call_base>> in_flight;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            for (auto& [ptr, c] : calls_) {
                in_flight.push_back(c);
            }
        }

        for (auto& c : in_flight) {
            c->fail_closed();
            c->cancel();
        }
        in_flight.clear();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!idle_.wait_for(lock, grace_, [this] { return calls_.empty(); })) {
                RELAY_LOG_WARNING("{} task(s) still running after {} ms shutdown grace; abandoning them",
                                  calls_.size(), grace_.count());
            }
        }

        scheduler_->shutdown();
        RELAY_LOG_DEBUG("background context closed");
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    size_t worker_threads() const noexcept { return scheduler_->num_threads(); }
    bool is_running() const noexcept { return scheduler_->is_running(); }

private:
    template<typename T>
    static coro::task<void> drive(background_context* ctx,
                                  std::shared_ptr<detail::call<T>> c,
                                  coro::task<result<T>> work) {
        try {
            c->signal.set_value(co_await std::move(work));
        } catch (...) {
            c->signal.set_exception(std::current_exception());
        }
        ctx->finished(c.get());
    }

    void finished(detail::call_base* c) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.erase(c);
        if (calls_.empty()) {
            idle_.notify_all();
        }
    }

    std::unique_ptr<runtime::scheduler> scheduler_;
    std::chrono::milliseconds grace_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<detail::call_base*, std::shared_ptr<detail::call_base>> calls_;
    bool closed_ = false;
};

} // namespace relay::blocking
