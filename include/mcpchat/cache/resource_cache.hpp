#pragma once

#include "mcpchat/async/periodic_timer.hpp"
#include "mcpchat/server/server_error.hpp"
#include "mcpchat/server/server.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcpchat {

struct ResourceCacheConfig {
    std::chrono::milliseconds ttl{3'600'000};
    std::size_t max_size{100 * 1024 * 1024};   // bytes of serialized content
    std::chrono::milliseconds cleanup_interval{300'000};
};

struct CacheEntry {
    std::string server_name;
    std::string uri;
    Json content;
    std::size_t size{0};
    TimePoint cached_at;
    TimePoint last_access;
    std::uint64_t hit_count{0};

    [[nodiscard]] Json to_json() const;   // metadata only
};

struct CacheStats {
    std::size_t total_entries{0};
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    double hit_rate{0.0};   // percent, two decimals
    std::size_t total_size{0};
    Millis avg_response_time{0};
    std::optional<TimePoint> last_cleanup;

    [[nodiscard]] Json to_json() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// ResourceCache
// ═══════════════════════════════════════════════════════════════════════════
// (server, uri) -> content with TTL expiry and least-recently-used eviction
// under a byte budget. The fetch runs without the lock, so two concurrent
// misses on one key both fetch and the later insert wins.

class ResourceCache {
public:
    using Fetcher = std::function<ServerResult<Json>()>;
    using SubscribeHook = std::function<void(const std::string& server_name, const std::string& uri)>;

    explicit ResourceCache(ResourceCacheConfig config = {});
    ~ResourceCache();

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    /// Cached content, or the result of `fetch` (stored when it succeeds).
    [[nodiscard]] ServerResult<Json> get_resource(
        const std::string& server_name, const std::string& uri, const Fetcher& fetch);

    /// Returns true if an entry was removed.
    bool invalidate_resource(const std::string& server_name, const std::string& uri);

    /// Returns the number of entries removed.
    std::size_t clear_server_cache(const std::string& server_name);
    void clear_all();

    /// Drops expired entries; returns how many were dropped.
    std::size_t cleanup_expired();

    [[nodiscard]] std::vector<CacheEntry> list_resources() const;
    [[nodiscard]] CacheStats get_stats() const;

    /// Called once per (server, uri) after its first successful fetch.
    void set_subscribe_hook(SubscribeHook hook);

    void start_cleanup(asio::any_io_executor executor);
    void stop_cleanup();

    [[nodiscard]] const ResourceCacheConfig& config() const noexcept { return config_; }

private:
    using Key = std::pair<std::string, std::string>;

    struct Slot {
        CacheEntry entry;
        std::uint64_t access_seq{0};
    };

    [[nodiscard]] bool expired_locked(const Slot& slot, TimePoint now) const;
    void erase_locked(std::map<Key, Slot>::iterator it);
    void evict_for_locked(std::size_t incoming);
    void record_lookup_locked(bool hit, Millis elapsed);

    ResourceCacheConfig config_;

    mutable std::mutex mutex_;
    std::map<Key, Slot> entries_;
    std::size_t total_size_{0};
    std::uint64_t access_counter_{0};
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    Millis avg_response_time_{0};
    std::optional<TimePoint> last_cleanup_;
    std::set<Key> subscribed_;
    SubscribeHook subscribe_hook_;

    std::mutex timer_mutex_;
    std::unique_ptr<PeriodicTimer> cleanup_timer_;
};

}  // namespace mcpchat
