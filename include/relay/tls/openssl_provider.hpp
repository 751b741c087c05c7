#pragma once

#include <relay/tls/tls_provider.hpp>
#include <relay/tls/tls_context.hpp>
#include <relay/tls/tls_stream.hpp>
#include <relay/log/macros.hpp>

#include <memory>
#include <string>

namespace relay::tls {

struct openssl_options {
    bool verify_peer = true;            ///< Verify chain and host name
    std::string ca_file;                ///< Extra trusted CAs (PEM bundle)
    std::string ca_path;                ///< Extra trusted CAs (hashed directory)
    bool use_system_roots = true;       ///< Trust the system CA store
    std::string alpn = "http/1.1";      ///< Comma-separated ALPN list, empty to skip
    tls_version min_version = tls_version::tls_1_2;
};

/// TLS provider backed by OpenSSL
///
/// One SSL_CTX is shared by every handshake this provider performs.
class openssl_provider : public tls_provider {
public:
    /// Throws relay::exception (errc::tls) if the context cannot be configured
    explicit openssl_provider(openssl_options opts = {})
        : opts_(std::move(opts)), ctx_(std::make_shared<tls_context>(opts_.min_version)) {
        if (opts_.use_system_roots) {
            ctx_->use_default_verify_paths();
        }
        if (!opts_.ca_file.empty() || !opts_.ca_path.empty()) {
            auto loaded = ctx_->load_verify_locations(opts_.ca_file, opts_.ca_path);
            if (!loaded) {
                throw exception(std::move(loaded.error()));
            }
        }
        ctx_->set_verify_mode(opts_.verify_peer ? verify_mode::peer : verify_mode::none);
        auto alpn = ctx_->set_alpn_protocols(opts_.alpn);
        if (!alpn) {
            throw exception(std::move(alpn.error()));
        }
        if (!opts_.verify_peer) {
            RELAY_LOG_WARNING("TLS peer verification disabled");
        }
    }

    /// Non-throwing construction
    static result<std::shared_ptr<openssl_provider>> create(openssl_options opts = {}) {
        try {
            return std::make_shared<openssl_provider>(std::move(opts));
        } catch (const exception& e) {
            return std::unexpected(e.get_error());
        }
    }

    coro::task<result<std::unique_ptr<net::byte_stream>>>
    handshake(std::unique_ptr<net::byte_stream> stream, std::string hostname) override {
        if (hostname.empty()) {
            co_await stream->close();
            co_return fail(errc::tls, "invalid host name");
        }

        // Keep the context alive for the whole handshake
        auto ctx = ctx_;
        auto created = tls_stream::create(std::move(stream), *ctx);
        if (!created) {
            co_return std::unexpected(std::move(created.error()));
        }
        auto tls = std::move(*created);
        tls->set_hostname(hostname);

        auto hs = co_await tls->handshake();
        if (!hs) {
            co_await tls->close();
            co_return std::unexpected(std::move(hs.error()));
        }
        co_return std::unique_ptr<net::byte_stream>(std::move(tls));
    }

    const openssl_options& options() const noexcept { return opts_; }
    tls_context& context() noexcept { return *ctx_; }

private:
    openssl_options opts_;
    std::shared_ptr<tls_context> ctx_;
};

} // namespace relay::tls
