#pragma once

#include <relay/net/byte_stream.hpp>
#include <relay/runtime/scheduler.hpp>
#include <relay/io/io_awaitables.hpp>
#include <relay/log/macros.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace relay::net {

/// TCP socket options applied to outbound connections
struct tcp_options {
    bool no_delay = true;        ///< TCP_NODELAY (disable Nagle's algorithm)
    bool keep_alive = false;     ///< SO_KEEPALIVE
    int recv_buffer = 0;         ///< SO_RCVBUF (0 = system default)
    int send_buffer = 0;         ///< SO_SNDBUF (0 = system default)
};

/// Resolved socket address (IPv4 or IPv6)
struct socket_address {
    sockaddr_storage storage{};
    socklen_t length = 0;

    int family() const noexcept { return storage.ss_family; }

    const sockaddr* get() const noexcept {
        return reinterpret_cast<const sockaddr*>(&storage);
    }

    std::string to_string() const {
        char buf[INET6_ADDRSTRLEN] = {};
        uint16_t port = 0;
        if (storage.ss_family == AF_INET6) {
            auto* sa = reinterpret_cast<const sockaddr_in6*>(&storage);
            inet_ntop(AF_INET6, &sa->sin6_addr, buf, sizeof(buf));
            port = ntohs(sa->sin6_port);
            return std::string("[") + buf + "]:" + std::to_string(port);
        }
        auto* sa = reinterpret_cast<const sockaddr_in*>(&storage);
        inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf));
        port = ntohs(sa->sin_port);
        return std::string(buf) + ":" + std::to_string(port);
    }
};

/// Owned socket descriptor that can be aborted from another thread
///
/// abort() only shuts the socket down so the descriptor number is never
/// reused while an operation on it is still registered; close() releases it.
class socket_handle : public abort_handle {
public:
    explicit socket_handle(int fd) noexcept : fd_(fd) {}

    ~socket_handle() override { close(); }

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;

    int fd() const noexcept { return fd_; }

    bool is_aborted() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

    void abort() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0 && !aborted_) {
            ::shutdown(fd_, SHUT_RDWR);
            RELAY_LOG_DEBUG("socket {} aborted", fd_);
        }
        aborted_ = true;
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    mutable std::mutex mutex_;
    int fd_;
    bool aborted_ = false;
};

/// Connected TCP stream
///
/// I/O is registered with the io_context of the worker running the calling
/// coroutine, so a pooled stream may be picked up by any worker.
class tcp_stream : public byte_stream {
public:
    explicit tcp_stream(int fd)
        : handle_(std::make_shared<socket_handle>(fd)) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }

    ~tcp_stream() override {
        handle_->close();
    }

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;

    int fd() const noexcept { return handle_->fd(); }

    coro::task<io::io_result> read(void* buffer, size_t length) override {
        if (handle_->is_aborted()) {
            co_return io::io_result{-ECANCELED, 0};
        }
        co_return co_await io::async_recv(runtime::current_io_context(), handle_->fd(), buffer, length);
    }

    coro::task<io::io_result> write(const void* buffer, size_t length) override {
        if (handle_->is_aborted()) {
            co_return io::io_result{-ECANCELED, 0};
        }
        co_return co_await io::async_send(runtime::current_io_context(), handle_->fd(), buffer, length);
    }

    coro::task<void> close() override {
        handle_->close();
        co_return;
    }

    std::shared_ptr<abort_handle> aborter() override {
        return handle_;
    }

    bool set_no_delay(bool enable) {
        int flag = enable ? 1 : 0;
        return setsockopt(handle_->fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
    }

    bool set_keep_alive(bool enable) {
        int flag = enable ? 1 : 0;
        return setsockopt(handle_->fd(), SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag)) == 0;
    }

    /// Abort the stream; pending reads complete with end of stream
    void abort() noexcept { handle_->abort(); }

private:
    std::shared_ptr<socket_handle> handle_;
};

/// Start a non-blocking connect() and wait for it to finish
///
/// Yields 0 on success or -errno.
class connect_awaitable {
public:
    connect_awaitable(io::io_context& ctx, int fd, const socket_address& addr) noexcept
        : ctx_(ctx), fd_(fd), addr_(addr) {}

    bool await_ready() noexcept {
        if (::connect(fd_, addr_.get(), addr_.length) == 0) {
            result_ = 0;
            return true;
        }
        if (errno == EINPROGRESS) {
            return false;
        }
        result_ = -errno;
        return true;
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        wait_.emplace(io::async_connect_wait(ctx_, fd_));
        return wait_->await_suspend(awaiter);
    }

    int await_resume() noexcept {
        if (wait_) {
            return wait_->await_resume().result;
        }
        return result_;
    }

private:
    io::io_context& ctx_;
    int fd_;
    const socket_address& addr_;
    int result_ = 0;
    std::optional<io::io_awaitable> wait_;
};

/// Create a socket for `addr` and apply `opts`; returns the fd or -errno
inline int open_socket(const socket_address& addr, const tcp_options& opts) {
    int fd = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -errno;
    }
    auto set = [fd](int level, int name, int value, const char* what) {
        if (::setsockopt(fd, level, name, &value, sizeof(value)) != 0) {
            RELAY_LOG_WARNING("setsockopt({}) failed: {}", what, std::strerror(errno));
        }
    };
    if (opts.no_delay) {
        set(IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");
    }
    if (opts.keep_alive) {
        set(SOL_SOCKET, SO_KEEPALIVE, 1, "SO_KEEPALIVE");
    }
    if (opts.recv_buffer > 0) {
        set(SOL_SOCKET, SO_RCVBUF, opts.recv_buffer, "SO_RCVBUF");
    }
    if (opts.send_buffer > 0) {
        set(SOL_SOCKET, SO_SNDBUF, opts.send_buffer, "SO_SNDBUF");
    }
    return fd;
}

} // namespace relay::net
