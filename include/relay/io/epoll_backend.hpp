#pragma once

#include "io_backend.hpp"
#include <relay/log/macros.hpp>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <chrono>

namespace relay::io {

/// epoll backend
///
/// Edge-triggered. An fd stays registered only while it has pending
/// operations, so a socket can be handed from one worker's backend to
/// another between operations (pooled connections do exactly that).
///
/// Ready operations are performed here, not by the awaiter: the backend
/// calls recv()/send() and delivers the result through get_last_result().
class epoll_backend : public io_backend {
public:
    struct config {
        size_t max_events = 256;
    };

    epoll_backend() : epoll_backend(config{}) {}

    explicit epoll_backend(const config& cfg)
        : events_(cfg.max_events) {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(
                std::string("epoll_create1 failed: ") + strerror(errno));
        }

        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            int err = errno;
            ::close(epoll_fd_);
            throw std::runtime_error(
                std::string("eventfd creation failed: ") + strerror(err));
        }

        struct epoll_event wake_ev{};
        wake_ev.events = EPOLLIN;
        wake_ev.data.fd = wake_fd_;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &wake_ev) < 0) {
            int err = errno;
            ::close(wake_fd_);
            ::close(epoll_fd_);
            throw std::runtime_error(
                std::string("epoll_ctl for wake_fd failed: ") + strerror(err));
        }

        RELAY_LOG_DEBUG("epoll_backend initialized (max_events={})", cfg.max_events);
    }

    ~epoll_backend() override {
        // Awaiters still parked here belong to frames the scheduler has
        // already torn down; resuming them would touch freed memory.
        if (pending_count_ > 0) {
            RELAY_LOG_WARNING("epoll_backend destroyed with {} pending operations", pending_count_);
        }
        ::close(wake_fd_);
        ::close(epoll_fd_);
    }

    epoll_backend(const epoll_backend&) = delete;
    epoll_backend& operator=(const epoll_backend&) = delete;
    epoll_backend(epoll_backend&&) = delete;
    epoll_backend& operator=(epoll_backend&&) = delete;

    bool prepare(const io_request& req) override {
        uint32_t interest = 0;
        switch (req.op) {
            case io_op::read:
            case io_op::recv:
                interest = EPOLLIN | EPOLLRDHUP;
                break;
            case io_op::write:
            case io_op::send:
            case io_op::connect:
                interest = EPOLLOUT;
                break;
            case io_op::none:
                errno = EINVAL;
                return false;
        }

        auto& state = fd_states_[req.fd];
        uint32_t events = state.events | interest | EPOLLET;

        struct epoll_event ev{};
        ev.events = events;
        ev.data.fd = req.fd;
        int ret = epoll_ctl(epoll_fd_, state.registered ? EPOLL_CTL_MOD : EPOLL_CTL_ADD,
                            req.fd, &ev);
        if (ret < 0) {
            int err = errno;
            RELAY_LOG_WARNING("epoll_ctl failed for fd {}: {}", req.fd, strerror(err));
            if (state.pending_ops.empty()) {
                fd_states_.erase(req.fd);
            }
            errno = err;
            return false;
        }

        state.registered = true;
        state.events = events;
        state.pending_ops.push_back(req);
        ++pending_count_;
        RELAY_LOG_DEBUG("Prepared io_op::{} on fd={}", static_cast<int>(req.op), req.fd);
        return true;
    }

    int poll(std::chrono::milliseconds timeout) override {
        int timeout_ms = timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());

        int nfds = epoll_wait(epoll_fd_, events_.data(),
                              static_cast<int>(events_.size()), timeout_ms);
        if (nfds < 0) {
            if (errno == EINTR) {
                return 0;
            }
            RELAY_LOG_ERROR("epoll_wait failed: {}", strerror(errno));
            return -1;
        }

        int completions = 0;
        std::vector<deferred_resume> resumes;

        for (int i = 0; i < nfds; ++i) {
            int fd = events_[i].data.fd;
            if (fd == wake_fd_) {
                drain_notify();
                continue;
            }

            auto it = fd_states_.find(fd);
            if (it == fd_states_.end()) {
                continue;
            }

            uint32_t revents = events_[i].events;
            auto& ops = it->second.pending_ops;
            for (auto op_it = ops.begin(); op_it != ops.end();) {
                if (!is_ready(op_it->op, revents)) {
                    ++op_it;
                    continue;
                }
                io_result res = perform(*op_it, revents);
                if (res.result == -EAGAIN || res.result == -EWOULDBLOCK) {
                    // Spurious readiness; wait for the next edge
                    ++op_it;
                    continue;
                }
                resumes.push_back({op_it->awaiter, res});
                op_it = ops.erase(op_it);
                --pending_count_;
                ++completions;
            }

            if (ops.empty()) {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                fd_states_.erase(it);
            }
        }

        // Resume only after the fd table is consistent again: a resumed
        // coroutine may immediately prepare its next operation.
        for (auto& entry : resumes) {
            last_result_ = entry.result;
            entry.handle.resume();
        }

        return completions;
    }

    bool has_pending() const noexcept override {
        return pending_count_ > 0;
    }

    size_t pending_count() const noexcept override {
        return pending_count_;
    }

    void notify() noexcept override {
        uint64_t val = 1;
        [[maybe_unused]] auto ret = ::write(wake_fd_, &val, sizeof(val));
    }

    static io_result get_last_result() noexcept {
        return last_result_;
    }

private:
    struct fd_state {
        std::vector<io_request> pending_ops;
        uint32_t events = 0;
        bool registered = false;
    };

    struct deferred_resume {
        std::coroutine_handle<> handle;
        io_result result;
    };

    void drain_notify() noexcept {
        uint64_t val;
        [[maybe_unused]] auto ret = ::read(wake_fd_, &val, sizeof(val));
    }

    static bool is_ready(io_op op, uint32_t revents) noexcept {
        constexpr uint32_t failure = EPOLLHUP | EPOLLERR;
        switch (op) {
            case io_op::read:
            case io_op::recv:
                return (revents & (EPOLLIN | EPOLLRDHUP | failure)) != 0;
            case io_op::write:
            case io_op::send:
            case io_op::connect:
                return (revents & (EPOLLOUT | failure)) != 0;
            case io_op::none:
                break;
        }
        return false;
    }

    static io_result perform(const io_request& req, uint32_t revents) noexcept {
        if (revents & EPOLLERR) {
            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(req.fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error != 0) {
                return {-error, 0};
            }
        }

        ssize_t n = 0;
        switch (req.op) {
            case io_op::read:
                n = ::read(req.fd, req.buffer, req.length);
                break;
            case io_op::recv:
                // Buffered data is still delivered after a hang-up; recv()
                // reports end of stream once it is drained.
                n = ::recv(req.fd, req.buffer, req.length, req.socket_flags);
                break;
            case io_op::write:
                if (revents & EPOLLHUP) return {-EPIPE, 0};
                n = ::write(req.fd, req.buffer, req.length);
                break;
            case io_op::send:
                if (revents & EPOLLHUP) return {-EPIPE, 0};
                n = ::send(req.fd, req.buffer, req.length, req.socket_flags | MSG_NOSIGNAL);
                break;
            case io_op::connect: {
                int error = 0;
                socklen_t len = sizeof(error);
                if (getsockopt(req.fd, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
                    return {-errno, 0};
                }
                if (error != 0) return {-error, 0};
                // A socket shut down while connecting reports HUP without an error
                if (revents & EPOLLHUP) return {-ECONNABORTED, 0};
                return {0, 0};
            }
            case io_op::none:
                return {-EINVAL, 0};
        }

        if (n < 0) {
            return {-errno, 0};
        }
        return {static_cast<int32_t>(n), 0};
    }

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, fd_state> fd_states_;
    size_t pending_count_ = 0;

    static inline thread_local io_result last_result_{};
};

} // namespace relay::io
