#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>
#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdint>

namespace relay::http {

/// HTTP methods
enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a C++ keyword
    OPTIONS,
    PATCH
};

inline constexpr std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::GET:      return "GET";
        case method::HEAD:     return "HEAD";
        case method::POST:     return "POST";
        case method::PUT:      return "PUT";
        case method::DELETE_:  return "DELETE";
        case method::OPTIONS:  return "OPTIONS";
        case method::PATCH:    return "PATCH";
    }
    return "UNKNOWN";
}

inline std::optional<method> string_to_method(std::string_view str) noexcept {
    if (str == "GET")     return method::GET;
    if (str == "HEAD")    return method::HEAD;
    if (str == "POST")    return method::POST;
    if (str == "PUT")     return method::PUT;
    if (str == "DELETE")  return method::DELETE_;
    if (str == "OPTIONS") return method::OPTIONS;
    if (str == "PATCH")   return method::PATCH;
    return std::nullopt;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// HTTP header list
///
/// Names compare case-insensitively; insertion order is kept so requests
/// serialize deterministically and repeated response headers survive.
class headers {
public:
    using entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry>::const_iterator;

    headers() = default;

    /// Set a header, replacing every existing value
    void set(std::string_view name, std::string_view value) {
        remove(name);
        entries_.emplace_back(std::string(name), std::string(value));
    }

    /// Append a header, keeping existing values
    void add(std::string_view name, std::string_view value) {
        entries_.emplace_back(std::string(name), std::string(value));
    }

    /// First value for `name`, or empty
    std::string_view get(std::string_view name) const {
        for (const auto& [n, v] : entries_) {
            if (iequals(n, name)) return v;
        }
        return {};
    }

    /// All values for `name`, in order
    std::vector<std::string_view> get_all(std::string_view name) const {
        std::vector<std::string_view> out;
        for (const auto& [n, v] : entries_) {
            if (iequals(n, name)) out.push_back(v);
        }
        return out;
    }

    bool contains(std::string_view name) const {
        return std::any_of(entries_.begin(), entries_.end(),
            [name](const entry& e) { return iequals(e.first, name); });
    }

    void remove(std::string_view name) {
        std::erase_if(entries_, [name](const entry& e) { return iequals(e.first, name); });
    }

    std::optional<size_t> content_length() const {
        auto val = get("Content-Length");
        if (val.empty()) return std::nullopt;
        size_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (ec == std::errc{} && ptr == val.data() + val.size()) return len;
        return std::nullopt;
    }

    void set_content_length(size_t len) {
        set("Content-Length", std::to_string(len));
    }

    std::string_view content_type() const {
        return get("Content-Type");
    }

    void set_content_type(std::string_view type) {
        set("Content-Type", type);
    }

    /// True if the final transfer coding is chunked
    bool is_chunked() const {
        auto values = get_all("Transfer-Encoding");
        if (values.empty()) return false;
        auto te = to_lower(values.back());
        auto last = te.rfind(',');
        std::string_view coding = last == std::string::npos
            ? std::string_view(te) : std::string_view(te).substr(last + 1);
        while (!coding.empty() && coding.front() == ' ') coding.remove_prefix(1);
        while (!coding.empty() && coding.back() == ' ') coding.remove_suffix(1);
        return coding == "chunked";
    }

    /// Whether the connection may be reused, given the message version
    bool keep_alive(std::string_view http_version = "1.1") const {
        auto conn = get("Connection");
        if (!conn.empty()) {
            auto lower = to_lower(conn);
            if (lower.find("close") != std::string::npos) return false;
            if (lower.find("keep-alive") != std::string::npos) return true;
        }
        // Default: HTTP/1.1 keeps alive, HTTP/1.0 closes
        return http_version == "1.1" || http_version == "HTTP/1.1";
    }

    void clear() { entries_.clear(); }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    std::string serialize() const {
        std::string out;
        for (const auto& [name, value] : entries_) {
            out += name;
            out += ": ";
            out += value;
            out += "\r\n";
        }
        return out;
    }

private:
    std::vector<entry> entries_;
};

/// URL components
///
/// parse() splits without judging: a URL with no "://" has an empty scheme
/// and an IPv6 host keeps its brackets. Deciding whether the result is a
/// usable destination is left to net::destination.
struct url {
    std::string scheme;     ///< lower-cased, empty if absent
    std::string host;       ///< as written, brackets included
    uint16_t port = 0;      ///< 0 = default for the scheme
    std::string path;       ///< path including leading /
    std::string query;      ///< without ?
    std::string fragment;   ///< without #
    std::string userinfo;   ///< username:password

    std::string path_with_query() const {
        std::string p = path.empty() ? "/" : path;
        if (query.empty()) return p;
        return p + "?" + query;
    }

    /// host[:port] as sent in the Host header
    std::string authority() const {
        std::string out = host;
        if (port != 0 && port != default_port()) {
            out += ":" + std::to_string(port);
        }
        return out;
    }

    std::string to_string() const {
        std::string out = scheme.empty() ? std::string() : scheme + "://";
        if (!userinfo.empty()) out += userinfo + "@";
        out += authority();
        out += path_with_query();
        if (!fragment.empty()) {
            out += "#" + fragment;
        }
        return out;
    }

    uint16_t effective_port() const {
        return port != 0 ? port : default_port();
    }

    uint16_t default_port() const {
        if (scheme == "https") return 443;
        return 80;
    }

    bool is_secure() const {
        return scheme == "https";
    }

    /// Split a URL; std::nullopt only for malformed input (bad port,
    /// unterminated IPv6 bracket)
    static std::optional<url> parse(std::string_view str) {
        url result;

        auto scheme_end = str.find("://");
        if (scheme_end != std::string_view::npos) {
            result.scheme = to_lower(str.substr(0, scheme_end));
            str = str.substr(scheme_end + 3);
        }

        auto frag_pos = str.find('#');
        if (frag_pos != std::string_view::npos) {
            result.fragment = str.substr(frag_pos + 1);
            str = str.substr(0, frag_pos);
        }

        auto query_pos = str.find('?');
        if (query_pos != std::string_view::npos) {
            result.query = str.substr(query_pos + 1);
            str = str.substr(0, query_pos);
        }

        auto path_pos = str.find('/');
        if (path_pos != std::string_view::npos) {
            result.path = str.substr(path_pos);
            str = str.substr(0, path_pos);
        } else {
            result.path = "/";
        }

        auto at_pos = str.rfind('@');
        if (at_pos != std::string_view::npos) {
            result.userinfo = str.substr(0, at_pos);
            str = str.substr(at_pos + 1);
        }

        std::string_view port_str;
        bool has_port = false;
        if (!str.empty() && str[0] == '[') {
            auto bracket_end = str.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::nullopt;
            }
            result.host = str.substr(0, bracket_end + 1);
            auto rest = str.substr(bracket_end + 1);
            if (!rest.empty()) {
                if (rest[0] != ':') return std::nullopt;
                port_str = rest.substr(1);
                has_port = true;
            }
        } else {
            auto colon_pos = str.rfind(':');
            if (colon_pos != std::string_view::npos) {
                result.host = str.substr(0, colon_pos);
                port_str = str.substr(colon_pos + 1);
                has_port = true;
            } else {
                result.host = str;
            }
        }

        if (has_port && !port_str.empty()) {
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::nullopt;
            }
            result.port = port;
        }

        return result;
    }
};

/// Common MIME types
namespace mime {
    inline constexpr std::string_view text_plain = "text/plain";
    inline constexpr std::string_view application_json = "application/json";
    inline constexpr std::string_view application_octet_stream = "application/octet-stream";
}

} // namespace relay::http
