#pragma once

#include <relay/tls/tls_context.hpp>
#include <relay/net/byte_stream.hpp>
#include <relay/coro/task.hpp>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <climits>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

namespace relay::tls {

namespace detail {

/// OpenSSL takes int lengths; larger requests are served in parts
constexpr int ssl_length(size_t length) noexcept {
    return static_cast<int>(std::min<size_t>(length, static_cast<size_t>(INT_MAX)));
}

} // namespace detail

/// TLS client session layered over any byte_stream
///
/// OpenSSL reads and writes records through a pair of memory BIOs; this
/// class moves the bytes between those BIOs and the inner stream, so the
/// inner stream may be a TCP socket or an in-memory test double.
class tls_stream : public net::byte_stream {
public:
    static constexpr size_t record_buffer_size = 16 * 1024;

    /// Wrap `inner`; fails with errc::tls if OpenSSL cannot allocate the session
    static result<std::unique_ptr<tls_stream>>
    create(std::unique_ptr<net::byte_stream> inner, tls_context& ctx) {
        SSL* ssl = SSL_new(ctx.native_handle());
        if (!ssl) {
            return fail(errc::tls, "failed to create SSL object", 0, ssl_error_string());
        }
        BIO* rbio = BIO_new(BIO_s_mem());
        BIO* wbio = BIO_new(BIO_s_mem());
        if (!rbio || !wbio) {
            if (rbio) BIO_free(rbio);
            if (wbio) BIO_free(wbio);
            SSL_free(ssl);
            return fail(errc::tls, "failed to create memory BIO", 0, ssl_error_string());
        }
        // The SSL object owns both BIOs from here on
        SSL_set_bio(ssl, rbio, wbio);
        SSL_set_connect_state(ssl);
        return std::unique_ptr<tls_stream>(new tls_stream(std::move(inner), ssl, rbio, wbio));
    }

    ~tls_stream() override {
        if (ssl_) {
            // No close_notify here: that needs I/O, see close()
            SSL_free(ssl_);
        }
    }

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    /// SNI and certificate name check; IP literals are matched against the
    /// certificate's IP SANs and sent without SNI
    void set_hostname(std::string_view hostname) {
        hostname_ = std::string(hostname);
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);

        in6_addr addr6{};
        in_addr addr4{};
        if (::inet_pton(AF_INET, hostname_.c_str(), &addr4) == 1 ||
            ::inet_pton(AF_INET6, hostname_.c_str(), &addr6) == 1) {
            X509_VERIFY_PARAM_set1_ip_asc(param, hostname_.c_str());
            return;
        }
        SSL_set_tlsext_host_name(ssl_, hostname_.c_str());
        X509_VERIFY_PARAM_set1_host(param, hostname_.c_str(), hostname_.size());
    }

    coro::task<result<void>> handshake() {
        while (true) {
            ERR_clear_error();
            int ret = SSL_connect(ssl_);

            if (ret == 1) {
                int flushed = co_await flush_output();
                if (flushed < 0) {
                    co_return fail(errc::tls, "handshake write failed", -flushed);
                }
                handshake_complete_ = true;
                RELAY_LOG_DEBUG("TLS handshake with {} complete (protocol: {}, cipher: {})",
                                hostname_, SSL_get_version(ssl_), SSL_get_cipher_name(ssl_));
                co_return result<void>{};
            }

            int err = SSL_get_error(ssl_, ret);
            // The OpenSSL error queue is per thread; read it before suspending
            std::string cause = describe_failure(err);

            int flushed = co_await flush_output();

            if (err == SSL_ERROR_WANT_READ) {
                if (flushed < 0) {
                    co_return fail(errc::tls, "handshake write failed", -flushed);
                }
                auto filled = co_await fill_input();
                if (filled.result == 0) {
                    co_return fail(errc::tls, "connection closed during handshake");
                }
                if (filled.result < 0) {
                    co_return fail(errc::tls, "handshake read failed", -filled.result);
                }
            } else if (err == SSL_ERROR_WANT_WRITE) {
                if (flushed < 0) {
                    co_return fail(errc::tls, "handshake write failed", -flushed);
                }
            } else {
                co_return fail(errc::tls, "handshake with " + hostname_ + " failed", 0, cause);
            }
        }
    }

    coro::task<io::io_result> read(void* buffer, size_t length) override {
        while (true) {
            ERR_clear_error();
            int ret = SSL_read(ssl_, buffer, detail::ssl_length(length));
            if (ret > 0) {
                co_return io::io_result{ret, 0};
            }

            int err = SSL_get_error(ssl_, ret);
            if (err == SSL_ERROR_ZERO_RETURN) {
                co_return io::io_result{0, 0};
            }
            if (err == SSL_ERROR_WANT_READ) {
                // Post-handshake messages (key updates) may need answering first
                int flushed = co_await flush_output();
                if (flushed < 0) {
                    co_return io::io_result{flushed, 0};
                }
                auto filled = co_await fill_input();
                if (filled.result <= 0) {
                    co_return filled;
                }
            } else if (err == SSL_ERROR_WANT_WRITE) {
                int flushed = co_await flush_output();
                if (flushed < 0) {
                    co_return io::io_result{flushed, 0};
                }
            } else {
                RELAY_LOG_DEBUG("TLS read error: {}", describe_failure(err));
                co_return io::io_result{-EIO, 0};
            }
        }
    }

    coro::task<io::io_result> write(const void* buffer, size_t length) override {
        while (true) {
            ERR_clear_error();
            int ret = SSL_write(ssl_, buffer, detail::ssl_length(length));
            if (ret > 0) {
                int flushed = co_await flush_output();
                if (flushed < 0) {
                    co_return io::io_result{flushed, 0};
                }
                co_return io::io_result{ret, 0};
            }

            int err = SSL_get_error(ssl_, ret);
            if (err == SSL_ERROR_WANT_READ) {
                auto filled = co_await fill_input();
                if (filled.result == 0) {
                    co_return io::io_result{-EPIPE, 0};
                }
                if (filled.result < 0) {
                    co_return filled;
                }
            } else if (err == SSL_ERROR_WANT_WRITE) {
                int flushed = co_await flush_output();
                if (flushed < 0) {
                    co_return io::io_result{flushed, 0};
                }
            } else {
                RELAY_LOG_DEBUG("TLS write error: {}", describe_failure(err));
                co_return io::io_result{-EIO, 0};
            }
        }
    }

    /// Send close_notify, then close the inner stream
    coro::task<void> close() override {
        if (handshake_complete_ && !closed_) {
            ERR_clear_error();
            SSL_shutdown(ssl_);
            ERR_clear_error();
            int flushed = co_await flush_output();
            if (flushed < 0) {
                RELAY_LOG_DEBUG("close_notify to {} not sent: {}", hostname_, std::strerror(-flushed));
            }
        }
        closed_ = true;
        co_await inner_->close();
    }

    std::shared_ptr<net::abort_handle> aborter() override {
        return inner_->aborter();
    }

    /// Negotiated ALPN protocol, empty if none
    std::string_view alpn_protocol() const {
        const unsigned char* proto = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(ssl_, &proto, &len);
        if (proto && len > 0) {
            return std::string_view(reinterpret_cast<const char*>(proto), len);
        }
        return {};
    }

    const char* version() const { return SSL_get_version(ssl_); }
    bool is_handshake_complete() const noexcept { return handshake_complete_; }

private:
    tls_stream(std::unique_ptr<net::byte_stream> inner, SSL* ssl, BIO* rbio, BIO* wbio)
        : inner_(std::move(inner)), ssl_(ssl), rbio_(rbio), wbio_(wbio) {}

    /// Move pending ciphertext from the write BIO to the inner stream
    /// @return 0, or -errno from the inner stream
    coro::task<int> flush_output() {
        while (BIO_ctrl_pending(wbio_) > 0) {
            int n = BIO_read(wbio_, out_buffer_.data(), static_cast<int>(out_buffer_.size()));
            if (n <= 0) break;
            int rc = co_await inner_->write_all(std::string_view(out_buffer_.data(), static_cast<size_t>(n)));
            if (rc < 0) {
                co_return rc;
            }
        }
        co_return 0;
    }

    /// Read one batch of ciphertext from the inner stream into the read BIO
    coro::task<io::io_result> fill_input() {
        auto res = co_await inner_->read(in_buffer_.data(), in_buffer_.size());
        if (res.result > 0) {
            BIO_write(rbio_, in_buffer_.data(), res.result);
        }
        co_return res;
    }

    std::string describe_failure(int err) const {
        switch (err) {
            case SSL_ERROR_SSL: {
                std::string text = ssl_error_string();
                long verify_err = SSL_get_verify_result(ssl_);
                if (verify_err != X509_V_OK) {
                    text += text.empty() ? "" : ": ";
                    text += X509_verify_cert_error_string(verify_err);
                }
                return text.empty() ? "protocol error" : text;
            }
            case SSL_ERROR_SYSCALL: return "unexpected end of stream";
            case SSL_ERROR_ZERO_RETURN: return "peer closed the session";
            default: return "SSL error " + std::to_string(err);
        }
    }

    std::unique_ptr<net::byte_stream> inner_;
    SSL* ssl_ = nullptr;
    BIO* rbio_ = nullptr;
    BIO* wbio_ = nullptr;
    std::string hostname_;
    bool handshake_complete_ = false;
    bool closed_ = false;
    std::array<char, record_buffer_size> in_buffer_{};
    std::array<char, record_buffer_size> out_buffer_{};
};

} // namespace relay::tls
