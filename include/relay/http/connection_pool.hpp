#pragma once

#include <relay/net/byte_stream.hpp>
#include <relay/log/macros.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay::http {

struct pool_config {
    /// Idle connections kept per host (std::nullopt = unlimited)
    std::optional<size_t> max_idle_per_host;
    /// Idle connections older than this are dropped (std::nullopt = never)
    std::optional<std::chrono::milliseconds> idle_timeout = std::chrono::seconds(90);
};

/// Idle keep-alive connections, keyed by "scheme://host:port"
///
/// The only state the engine shares between concurrent exchanges. Every
/// access goes through the mutex; streams are destroyed outside it.
class connection_pool {
public:
    using clock = std::chrono::steady_clock;

    explicit connection_pool(pool_config config = {}) : config_(config) {}

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    /// Most recently returned live connection for `key`, or nullptr
    ///
    /// Expired connections of every host are dropped on the way.
    std::unique_ptr<net::byte_stream> acquire(const std::string& key) {
        std::vector<std::unique_ptr<net::byte_stream>> expired;
        std::unique_ptr<net::byte_stream> found;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prune_locked(clock::now(), expired);
            auto it = idle_.find(key);
            if (it != idle_.end()) {
                found = std::move(it->second.back().stream);
                it->second.pop_back();
                if (it->second.empty()) {
                    idle_.erase(it);
                }
            }
        }
        if (!expired.empty()) {
            RELAY_LOG_DEBUG("dropped {} expired connection(s)", expired.size());
        }
        return found;
    }

    /// Keep `stream` for reuse; returns false if it was dropped instead
    bool release(const std::string& key, std::unique_ptr<net::byte_stream> stream) {
        std::vector<std::unique_ptr<net::byte_stream>> expired;
        bool kept = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = clock::now();
            prune_locked(now, expired);
            kept = keep_locked(key, stream, now);
        }
        if (!expired.empty()) {
            RELAY_LOG_DEBUG("dropped {} expired connection(s)", expired.size());
        }
        return kept;
    }

    /// Drop every idle connection
    void clear() {
        std::unordered_map<std::string, std::vector<entry>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped.swap(idle_);
        }
        size_t count = 0;
        for (auto& [key, list] : dropped) count += list.size();
        if (count > 0) {
            RELAY_LOG_DEBUG("connection pool cleared ({} idle)", count);
        }
    }

    size_t idle_count(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.find(key);
        return it == idle_.end() ? 0 : it->second.size();
    }

    size_t idle_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [key, list] : idle_) count += list.size();
        return count;
    }

    const pool_config& config() const noexcept { return config_; }

private:
    struct entry {
        std::unique_ptr<net::byte_stream> stream;
        clock::time_point idle_since;
    };

    bool keep_locked(const std::string& key, std::unique_ptr<net::byte_stream>& stream,
                     clock::time_point now) {
        if (config_.max_idle_per_host && *config_.max_idle_per_host == 0) {
            return false;
        }
        auto& list = idle_[key];
        if (config_.max_idle_per_host && list.size() >= *config_.max_idle_per_host) {
            RELAY_LOG_DEBUG("pool for {} full, dropping connection", key);
            return false;
        }
        list.push_back(entry{std::move(stream), now});
        return true;
    }

    /// Move expired entries of every key into `out`; the caller destroys
    /// them after releasing the lock
    void prune_locked(clock::time_point now, std::vector<std::unique_ptr<net::byte_stream>>& out) {
        if (!config_.idle_timeout) {
            return;
        }
        for (auto it = idle_.begin(); it != idle_.end();) {
            auto& list = it->second;
            auto live = std::stable_partition(list.begin(), list.end(),
                [this, now](const entry& e) { return !is_expired(e, now); });
            for (auto e = live; e != list.end(); ++e) {
                out.push_back(std::move(e->stream));
            }
            list.erase(live, list.end());
            it = list.empty() ? idle_.erase(it) : std::next(it);
        }
    }

    bool is_expired(const entry& e, clock::time_point now) const {
        return config_.idle_timeout && now - e.idle_since >= *config_.idle_timeout;
    }

    pool_config config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<entry>> idle_;
};

} // namespace relay::http
