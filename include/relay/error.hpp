#pragma once

#include <fmt/format.h>

#include <cstring>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace relay {

/// Failure categories reported by every relay operation
enum class errc {
    unsupported_scheme,  ///< Scheme is neither http nor https, or TLS is unavailable
    connect,             ///< Name resolution or TCP connect failed
    tls,                 ///< TLS handshake failed
    runtime_init,        ///< Background execution context could not start
    closed,              ///< Blocking adapter was torn down
    invalid_url,         ///< URL is missing a scheme or host
    body_not_allowed,    ///< GET, HEAD and DELETE requests cannot carry a body
    io,                  ///< Transport failure during an exchange
    protocol,            ///< Malformed HTTP response
    cancelled            ///< Operation cancelled by its token
};

constexpr std::string_view errc_to_string(errc e) noexcept {
    switch (e) {
        case errc::unsupported_scheme: return "unsupported scheme";
        case errc::connect:            return "connect error";
        case errc::tls:                return "TLS error";
        case errc::runtime_init:       return "runtime init error";
        case errc::closed:             return "closed";
        case errc::invalid_url:        return "invalid url";
        case errc::body_not_allowed:   return "body not allowed";
        case errc::io:                 return "I/O error";
        case errc::protocol:           return "protocol error";
        case errc::cancelled:          return "cancelled";
    }
    return "unknown";
}

/// Error value carried by relay::result
///
/// `code` holds the errno that caused the failure (0 when none) and `cause`
/// the text of the lower layer (resolver, OpenSSL, parser).
class error {
public:
    error(errc kind, std::string message, int code = 0, std::string cause = {})
        : kind_(kind)
        , message_(std::move(message))
        , code_(code)
        , cause_(std::move(cause)) {
        if (cause_.empty() && code_ != 0) {
            cause_ = std::strerror(code_);
        }
    }

    errc kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    int code() const noexcept { return code_; }
    const std::string& cause() const noexcept { return cause_; }

    bool is(errc kind) const noexcept { return kind_ == kind; }

    std::string to_string() const {
        std::string out(errc_to_string(kind_));
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        if (!cause_.empty()) {
            out += ": ";
            out += cause_;
        }
        return out;
    }

private:
    errc kind_;
    std::string message_;
    int code_;
    std::string cause_;
};

template<typename T>
using result = std::expected<T, error>;

/// Shorthand for building the unexpected branch of a result
inline std::unexpected<error> fail(errc kind, std::string message, int code = 0, std::string cause = {}) {
    return std::unexpected(error(kind, std::move(message), code, std::move(cause)));
}

/// Thrown where a failure cannot be returned, e.g. from a constructor
class exception : public std::runtime_error {
public:
    explicit exception(error err)
        : std::runtime_error(err.to_string())
        , error_(std::move(err)) {}

    const error& get_error() const noexcept { return error_; }

private:
    error error_;
};

} // namespace relay

template<>
struct fmt::formatter<relay::error> {
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const relay::error& err, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", err.to_string());
    }
};
