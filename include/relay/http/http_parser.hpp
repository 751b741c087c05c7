#pragma once

#include <relay/http/http_common.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace relay::http {

/// HTTP parser result
enum class parse_result {
    need_more,      ///< Need more data
    complete,       ///< Parsing complete
    error           ///< Parse error
};

/// Parses a response status line and header block
///
/// The body is left in the caller's buffer for body_decoder, so the head
/// parser never copies body bytes.
class response_head_parser {
public:
    static constexpr size_t max_head_size = 64 * 1024;

    response_head_parser() = default;

    void reset() {
        state_ = state::status_line;
        status_code_ = 0;
        version_.clear();
        reason_.clear();
        headers_.clear();
        head_size_ = 0;
        error_message_.clear();
    }

    /// Consume head bytes from the front of `buffer`
    parse_result parse(std::string& buffer) {
        while (state_ != state::complete && state_ != state::error) {
            auto line_end = buffer.find("\r\n");
            if (line_end == std::string::npos) {
                if (head_size_ + buffer.size() > max_head_size) {
                    set_error("response head too large");
                    return parse_result::error;
                }
                return parse_result::need_more;
            }

            head_size_ += line_end + 2;
            if (head_size_ > max_head_size) {
                set_error("response head too large");
                return parse_result::error;
            }

            std::string_view line(buffer.data(), line_end);
            bool ok = state_ == state::status_line ? parse_status_line(line) : parse_header_line(line);
            buffer.erase(0, line_end + 2);
            if (!ok) {
                return parse_result::error;
            }
        }
        return state_ == state::complete ? parse_result::complete : parse_result::error;
    }

    uint16_t status_code() const noexcept { return status_code_; }

    /// "1.1" or "1.0"
    std::string_view version() const noexcept { return version_; }
    std::string_view reason() const noexcept { return reason_; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    std::string_view error_message() const noexcept { return error_message_; }
    bool is_complete() const noexcept { return state_ == state::complete; }

private:
    enum class state { status_line, headers, complete, error };

    bool parse_status_line(std::string_view line) {
        // HTTP/1.1 200 OK
        if (!line.starts_with("HTTP/")) {
            set_error("invalid status line");
            return false;
        }
        auto space1 = line.find(' ');
        if (space1 == std::string_view::npos) {
            set_error("invalid status line: no status code");
            return false;
        }
        version_ = line.substr(5, space1 - 5);

        auto rest = line.substr(space1 + 1);
        auto space2 = rest.find(' ');
        auto code_str = rest.substr(0, space2);
        uint16_t code = 0;
        auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), code);
        if (ec != std::errc{} || ptr != code_str.data() + code_str.size() ||
            code_str.size() != 3 || code < 100) {
            set_error("invalid status code");
            return false;
        }
        status_code_ = code;
        if (space2 != std::string_view::npos) {
            reason_ = rest.substr(space2 + 1);
        }
        state_ = state::headers;
        return true;
    }

    bool parse_header_line(std::string_view line) {
        if (line.empty()) {
            state_ = state::complete;
            return true;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            set_error("invalid header line");
            return false;
        }

        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }

        headers_.add(name, value);
        return true;
    }

    void set_error(std::string_view msg) {
        state_ = state::error;
        error_message_ = msg;
    }

    state state_ = state::status_line;
    uint16_t status_code_ = 0;
    std::string version_;
    std::string reason_;
    headers headers_;
    size_t head_size_ = 0;
    std::string error_message_;
};

/// Incremental decoder for a response body
///
/// Framing is decided once from the request method, the status and the
/// response headers. decode() moves payload bytes from the network buffer
/// to `out`; whatever follows the body stays in the buffer.
class body_decoder {
public:
    enum class framing {
        none,            ///< No body (HEAD, 1xx, 204, 304, Content-Length: 0)
        content_length,
        chunked,
        until_close      ///< Delimited by the server closing the connection
    };

    body_decoder() = default;

    static body_decoder for_response(method m, uint16_t status, const headers& hdrs) {
        body_decoder d;
        if (m == method::HEAD || status < 200 || status == 204 || status == 304) {
            d.framing_ = framing::none;
            d.state_ = state::done;
        } else if (hdrs.is_chunked()) {
            d.framing_ = framing::chunked;
            d.state_ = state::chunk_size;
        } else if (auto len = hdrs.content_length()) {
            d.remaining_ = *len;
            d.framing_ = *len == 0 ? framing::none : framing::content_length;
            d.state_ = *len == 0 ? state::done : state::data;
        } else if (hdrs.contains("Content-Length")) {
            d.framing_ = framing::content_length;
            d.set_error("invalid Content-Length");
        } else {
            d.framing_ = framing::until_close;
            d.state_ = state::data;
        }
        return d;
    }

    framing get_framing() const noexcept { return framing_; }

    /// Decode what `buffer` holds; complete once the body has ended
    parse_result decode(std::string& buffer, std::string& out) {
        while (state_ != state::done && state_ != state::error) {
            switch (state_) {
                case state::data:
                    if (framing_ == framing::until_close) {
                        out.append(buffer);
                        buffer.clear();
                        return parse_result::need_more;
                    }
                    if (!take_data(buffer, out)) return parse_result::need_more;
                    break;
                case state::chunk_size:
                    if (!parse_chunk_size(buffer)) return result_for_state();
                    break;
                case state::chunk_data:
                    if (!take_data(buffer, out)) return parse_result::need_more;
                    if (remaining_ == 0) state_ = state::chunk_crlf;
                    break;
                case state::chunk_crlf:
                    if (buffer.size() < 2) return parse_result::need_more;
                    if (buffer[0] != '\r' || buffer[1] != '\n') {
                        set_error("missing CRLF after chunk");
                        return parse_result::error;
                    }
                    buffer.erase(0, 2);
                    state_ = state::chunk_size;
                    break;
                case state::trailer:
                    if (!skip_trailer(buffer)) return parse_result::need_more;
                    break;
                default:
                    break;
            }
        }
        return result_for_state();
    }

    /// The connection reached end of stream; complete if that ends the body
    parse_result finish() {
        if (state_ == state::done) return parse_result::complete;
        if (state_ == state::error) return parse_result::error;
        if (framing_ == framing::until_close) {
            state_ = state::done;
            return parse_result::complete;
        }
        set_error("connection closed before end of body");
        return parse_result::error;
    }

    bool is_done() const noexcept { return state_ == state::done; }
    std::string_view error_message() const noexcept { return error_message_; }

private:
    enum class state { data, chunk_size, chunk_data, chunk_crlf, trailer, done, error };

    parse_result result_for_state() const noexcept {
        if (state_ == state::done) return parse_result::complete;
        if (state_ == state::error) return parse_result::error;
        return parse_result::need_more;
    }

    bool take_data(std::string& buffer, std::string& out) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, buffer.size()));
        out.append(buffer.data(), n);
        buffer.erase(0, n);
        remaining_ -= n;
        if (remaining_ == 0 && framing_ == framing::content_length) {
            state_ = state::done;
            return true;
        }
        return remaining_ == 0;
    }

    bool parse_chunk_size(std::string& buffer) {
        auto line_end = buffer.find("\r\n");
        if (line_end == std::string::npos) {
            if (buffer.size() > 1024) set_error("chunk size line too long");
            return false;
        }

        std::string_view line(buffer.data(), line_end);
        auto ext = line.find(';');
        if (ext != std::string_view::npos) line = line.substr(0, ext);
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.remove_suffix(1);

        uint64_t size = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
        if (line.empty() || ec != std::errc{} || ptr != line.data() + line.size()) {
            set_error("invalid chunk size");
            return false;
        }

        buffer.erase(0, line_end + 2);
        remaining_ = size;
        state_ = size == 0 ? state::trailer : state::chunk_data;
        return true;
    }

    bool skip_trailer(std::string& buffer) {
        while (true) {
            auto line_end = buffer.find("\r\n");
            if (line_end == std::string::npos) return false;
            buffer.erase(0, line_end + 2);
            if (line_end == 0) {
                state_ = state::done;
                return true;
            }
        }
    }

    void set_error(std::string_view msg) {
        state_ = state::error;
        error_message_ = msg;
    }

    framing framing_ = framing::none;
    state state_ = state::done;
    uint64_t remaining_ = 0;
    std::string error_message_;
};

} // namespace relay::http
