#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace relay::log {

enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
    }
    return "UNKNOWN";
}

/// Parse a level name as accepted in RELAY_LOG_LEVEL
inline std::optional<level> level_from_string(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warning" || name == "warn") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

/// "src/net/tcp.hpp" -> "tcp.hpp"
constexpr std::string_view base_name(std::string_view path) noexcept {
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

/// Process-wide logger
///
/// Lines go to stderr unless redirected with set_output(). ANSI colors are
/// used only when the output is a terminal. The level starts at info.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Apply RELAY_LOG_LEVEL if it is set; false when it names no level
    bool configure_from_env() noexcept {
        const char* env = std::getenv("RELAY_LOG_LEVEL");
        if (!env) {
            return true;
        }
        auto lvl = level_from_string(env);
        if (!lvl) {
            return false;
        }
        set_level(*lvl);
        return true;
    }

    /// Redirect output; nullptr restores stderr. The caller keeps `out` open.
    void set_output(std::FILE* out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : stderr;
        color_ = ::isatty(::fileno(out_)) == 1;
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto stamp = fmt::localtime(std::chrono::system_clock::to_time_t(now));

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(out_, "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] {:<5} {}:{} {}{}\n",
                   color_ ? color_of(lvl) : "",
                   stamp, ms.count(), level_to_string(lvl),
                   base_name(file), line, msg,
                   color_ ? "\033[0m" : "");
        std::fflush(out_);
    }

private:
    logger() noexcept
        : min_level_(level::info)
        , out_(stderr)
        , color_(::isatty(STDERR_FILENO) == 1) {}

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static constexpr const char* color_of(level lvl) noexcept {
        switch (lvl) {
            case level::debug:   return "\033[36m";
            case level::info:    return "\033[32m";
            case level::warning: return "\033[33m";
            case level::error:   return "\033[31m";
        }
        return "";
    }

    std::atomic<level> min_level_;
    std::mutex mutex_;
    std::FILE* out_;
    bool color_;
};

} // namespace relay::log
