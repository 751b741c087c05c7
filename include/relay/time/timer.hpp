#pragma once

#include <relay/io/io_awaitables.hpp>
#include <relay/runtime/scheduler.hpp>
#include <relay/coro/cancel_token.hpp>
#include <relay/coro/task.hpp>
#include <relay/log/macros.hpp>

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <thread>

namespace relay::time {

namespace detail {

inline itimerspec one_shot(std::chrono::nanoseconds after) noexcept {
    itimerspec spec{};
    spec.it_value.tv_sec = static_cast<time_t>(after.count() / 1'000'000'000);
    spec.it_value.tv_nsec = static_cast<long>(after.count() % 1'000'000'000);
    return spec;
}

/// Owns a timerfd for the length of one sleep
class timer_fd {
public:
    timer_fd() : fd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {}
    ~timer_fd() {
        if (fd_ >= 0) ::close(fd_);
    }

    timer_fd(const timer_fd&) = delete;
    timer_fd& operator=(const timer_fd&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    bool arm(std::chrono::nanoseconds after) const noexcept {
        auto spec = one_shot(after);
        return ::timerfd_settime(fd_, 0, &spec, nullptr) == 0;
    }

private:
    int fd_;
};

/// Used when no timerfd is available: sleeps the calling thread in slices
inline coro::cancel_result polling_sleep(std::chrono::nanoseconds duration,
                                         const coro::cancel_token& token) {
    auto end_time = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < end_time) {
        if (token.is_cancelled()) {
            return coro::cancel_result::cancelled;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return coro::cancel_result::completed;
}

} // namespace detail

/// Sleep on the current worker's io_context
///
/// The timer is a timerfd read through the epoll backend, so the worker
/// keeps running other tasks meanwhile. Cancelling the token fires the
/// timer at once; the result says which of the two ended the wait.
inline coro::task<coro::cancel_result>
sleep_for(std::chrono::nanoseconds duration, coro::cancel_token token = {}) {
    if (token.is_cancelled()) {
        co_return coro::cancel_result::cancelled;
    }
    if (duration.count() <= 0) {
        co_return coro::cancel_result::completed;
    }

    detail::timer_fd timer;
    if (!timer.valid() || !timer.arm(duration)) {
        RELAY_LOG_WARNING("sleep_for: timerfd unavailable ({}), using polling sleep",
                          std::strerror(errno));
        co_return detail::polling_sleep(duration, token);
    }

    uint64_t expirations = 0;
    io::io_result res{};
    {
        // The callback may run on any thread; timerfd_settime is safe there
        auto reg = token.on_cancel([fd = timer.get()] {
            auto now = detail::one_shot(std::chrono::nanoseconds(1));
            ::timerfd_settime(fd, 0, &now, nullptr);
        });
        res = co_await io::async_read(runtime::current_io_context(), timer.get(),
                                      &expirations, sizeof(expirations));
    }

    if (token.is_cancelled()) {
        co_return coro::cancel_result::cancelled;
    }
    if (res.result < 0) {
        RELAY_LOG_WARNING("sleep_for: timer read failed: {}", std::strerror(-res.result));
    }
    co_return coro::cancel_result::completed;
}

template<typename Rep, typename Period>
coro::task<coro::cancel_result>
sleep_for(std::chrono::duration<Rep, Period> duration, coro::cancel_token token = {}) {
    return sleep_for(std::chrono::duration_cast<std::chrono::nanoseconds>(duration), std::move(token));
}

} // namespace relay::time
