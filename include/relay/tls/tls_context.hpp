#pragma once

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <relay/error.hpp>
#include <relay/log/macros.hpp>

#include <string>
#include <string_view>

namespace relay::tls {

/// Minimum accepted protocol version
enum class tls_version {
    tls_1_2,
    tls_1_3
};

enum class verify_mode {
    none,   ///< Accept any certificate
    peer    ///< Verify the server certificate chain and host name
};

/// Text of the oldest error on this thread's OpenSSL error queue, then clear it
inline std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return {};
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return std::string(buf);
}

/// Client SSL_CTX wrapper
///
/// Configured once, then shared read-only by every connection created from
/// it. Throws relay::exception (errc::tls) if OpenSSL cannot create the
/// context.
class tls_context {
public:
    explicit tls_context(tls_version min_version = tls_version::tls_1_2) {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw exception(error(errc::tls, "failed to create SSL context", 0, ssl_error_string()));
        }

        SSL_CTX_set_min_proto_version(ctx_, min_version == tls_version::tls_1_3
                                                ? TLS1_3_VERSION : TLS1_2_VERSION);
        SSL_CTX_set_options(ctx_, SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT);

        RELAY_LOG_DEBUG("TLS client context created (min={})",
                        min_version == tls_version::tls_1_3 ? "1.3" : "1.2");
    }

    ~tls_context() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
        }
    }

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    tls_context(tls_context&& other) noexcept
        : ctx_(other.ctx_) {
        other.ctx_ = nullptr;
    }

    tls_context& operator=(tls_context&& other) noexcept {
        if (this != &other) {
            if (ctx_) SSL_CTX_free(ctx_);
            ctx_ = other.ctx_;
            other.ctx_ = nullptr;
        }
        return *this;
    }

    /// Trust the CA certificates in `ca_file` and/or the hashed directory `ca_path`
    result<void> load_verify_locations(const std::string& ca_file, const std::string& ca_path = {}) {
        const char* file = ca_file.empty() ? nullptr : ca_file.c_str();
        const char* path = ca_path.empty() ? nullptr : ca_path.c_str();

        if (SSL_CTX_load_verify_locations(ctx_, file, path) != 1) {
            auto cause = ssl_error_string();
            RELAY_LOG_ERROR("Failed to load CA certificates: {}", cause);
            return fail(errc::tls, "failed to load CA certificates", 0, cause);
        }
        return {};
    }

    /// Trust the system CA store
    /// Tries the common distribution bundles before OpenSSL's compiled-in default
    bool use_default_verify_paths() {
        static const struct {
            const char* file;
            const char* dir;
        } ca_locations[] = {
            {"/etc/ssl/certs/ca-certificates.crt", "/etc/ssl/certs"},     // Debian/Ubuntu
            {"/etc/pki/tls/certs/ca-bundle.crt", "/etc/pki/tls/certs"},   // Fedora/RHEL
            {"/etc/ssl/ca-bundle.pem", "/etc/ssl/certs"},                  // OpenSUSE
            {"/etc/ssl/cert.pem", "/etc/ssl/certs"},                       // Alpine
        };

        for (const auto& loc : ca_locations) {
            if (SSL_CTX_load_verify_locations(ctx_, loc.file, loc.dir) == 1) {
                RELAY_LOG_DEBUG("Loaded CA certificates from {}", loc.file);
                return true;
            }
            ERR_clear_error();
        }

        if (SSL_CTX_set_default_verify_paths(ctx_) == 1) {
            RELAY_LOG_DEBUG("Using OpenSSL default CA paths");
            return true;
        }

        RELAY_LOG_WARNING("Failed to load system CA certificates");
        ERR_clear_error();
        return false;
    }

    void set_verify_mode(verify_mode mode) {
        SSL_CTX_set_verify(ctx_, mode == verify_mode::peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
        SSL_CTX_set_verify_depth(ctx_, 10);
        verify_ = mode;
    }

    verify_mode get_verify_mode() const noexcept { return verify_; }

    /// @param protocols Comma-separated list, e.g. "http/1.1"
    result<void> set_alpn_protocols(std::string_view protocols) {
        // Wire format: each protocol prefixed by its length
        std::string wire;
        size_t start = 0;
        while (start < protocols.size()) {
            size_t end = protocols.find(',', start);
            if (end == std::string_view::npos) end = protocols.size();

            size_t len = end - start;
            if (len > 0 && len <= 255) {
                wire += static_cast<char>(len);
                wire += protocols.substr(start, len);
            }
            start = end + 1;
        }
        if (wire.empty()) {
            return {};
        }

        // Unlike most of OpenSSL, 0 means success here
        if (SSL_CTX_set_alpn_protos(ctx_,
                reinterpret_cast<const unsigned char*>(wire.data()),
                static_cast<unsigned>(wire.size())) != 0) {
            return fail(errc::tls, "failed to set ALPN protocols", 0, std::string(protocols));
        }
        return {};
    }

    SSL_CTX* native_handle() noexcept { return ctx_; }
    const SSL_CTX* native_handle() const noexcept { return ctx_; }

    /// Verifying client context trusting the system CA store
    static tls_context make_client() {
        tls_context ctx;
        ctx.use_default_verify_paths();
        ctx.set_verify_mode(verify_mode::peer);
        return ctx;
    }

private:
    SSL_CTX* ctx_ = nullptr;
    verify_mode verify_ = verify_mode::none;
};

} // namespace relay::tls
