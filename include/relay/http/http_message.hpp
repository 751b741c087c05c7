#pragma once

#include <relay/http/http_common.hpp>
#include <relay/http/shared_body.hpp>
#include <relay/http/body_reader.hpp>
#include <relay/net/destination.hpp>
#include <relay/error.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relay::http {

/// Request descriptor: method, target URL, headers and an optional body
class request {
public:
    /// Fails with errc::invalid_url (or errc::unsupported_scheme) for a
    /// URL that cannot name a destination
    static result<request> make(method m, std::string_view url_str) {
        auto parsed = url::parse(url_str);
        if (!parsed) {
            return fail(errc::invalid_url, "invalid URI", 0, std::string(url_str));
        }
        auto dest = net::destination::from_url(*parsed);
        if (!dest) {
            return std::unexpected(std::move(dest.error()));
        }
        return request(m, std::move(*parsed), std::move(*dest));
    }

    method get_method() const noexcept { return method_; }
    const url& get_url() const noexcept { return url_; }
    const net::destination& get_destination() const noexcept { return dest_; }

    /// Request target sent on the request line
    std::string target() const { return url_.path_with_query(); }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    void set_header(std::string_view name, std::string_view value) {
        headers_.set(name, value);
    }

    void set_body(shared_body b) { body_ = std::move(b); }

    void set_body(shared_body b, std::string_view content_type) {
        body_ = std::move(b);
        headers_.set_content_type(content_type);
    }

    const std::optional<shared_body>& body() const noexcept { return body_; }

    /// GET, HEAD and DELETE requests may not carry a body
    result<void> validate() const {
        if (body_ && forbids_body(method_)) {
            return fail(errc::body_not_allowed,
                        std::string(method_to_string(method_)) + " requests are not allowed to have a body");
        }
        return {};
    }

    /// Set Content-Length for methods that carry a body (0 when none)
    void apply_framing() {
        if (forbids_body(method_)) {
            return;
        }
        headers_.remove("Transfer-Encoding");
        headers_.set_content_length(body_ ? body_->size() : 0);
    }

    /// Request line and headers; the body is written separately
    std::string serialize_head() const {
        std::string out;
        out += method_to_string(method_);
        out += ' ';
        out += target();
        out += " HTTP/1.1\r\n";
        out += headers_.serialize();
        out += "\r\n";
        return out;
    }

    std::string serialize() const {
        std::string out = serialize_head();
        if (body_) out += body_->view();
        return out;
    }

    static constexpr bool forbids_body(method m) noexcept {
        return m == method::GET || m == method::HEAD || m == method::DELETE_;
    }

private:
    request(method m, url u, net::destination dest)
        : method_(m), url_(std::move(u)), dest_(std::move(dest)) {}

    method method_;
    url url_;
    net::destination dest_;
    headers headers_;
    std::optional<shared_body> body_;
};

/// Response head plus a streaming body
class response {
public:
    response(uint16_t status, std::string reason, std::string version,
             headers hdrs, std::shared_ptr<body_reader> body)
        : status_(status)
        , reason_(std::move(reason))
        , version_(std::move(version))
        , headers_(std::move(hdrs))
        , body_(std::move(body)) {}

    uint16_t status_code() const noexcept { return status_; }
    std::string_view reason() const noexcept { return reason_; }
    std::string_view version() const noexcept { return version_; }

    bool is_success() const noexcept { return status_ >= 200 && status_ < 300; }

    const headers& get_headers() const noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }

    body_reader& body() noexcept { return *body_; }

    /// Shared handle to the body, for readers that outlive this object
    std::shared_ptr<body_reader> body_ptr() const noexcept { return body_; }

private:
    uint16_t status_;
    std::string reason_;
    std::string version_;
    headers headers_;
    std::shared_ptr<body_reader> body_;
};

} // namespace relay::http
