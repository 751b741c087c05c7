#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace relay::http {

/// Immutable request body that is cheap to copy
///
/// Holds either a reference-counted string or a view of static storage, so
/// the same payload can be sent by many requests (and retried) without
/// copying it.
class shared_body {
public:
    shared_body() = default;

    explicit shared_body(std::string data)
        : data_(std::make_shared<const std::string>(std::move(data))) {}

    explicit shared_body(std::shared_ptr<const std::string> data)
        : data_(std::move(data)) {}

    /// `data` must outlive every copy of the body
    static shared_body from_static(std::string_view data) {
        shared_body b;
        b.static_ = data;
        return b;
    }

    std::string_view view() const noexcept {
        if (data_) return *data_;
        return static_;
    }

    size_t size() const noexcept { return view().size(); }
    bool empty() const noexcept { return size() == 0; }

private:
    std::shared_ptr<const std::string> data_;
    std::string_view static_;
};

} // namespace relay::http
