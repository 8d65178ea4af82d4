#include "mcpchat/cache/resource_cache.hpp"
#include "mcpchat/log/logger.hpp"

#include <cmath>

namespace mcpchat {

namespace {

[[nodiscard]] std::int64_t epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

Json CacheEntry::to_json() const {
    return {
        {"server", server_name},
        {"uri", uri},
        {"size", size},
        {"cached_at", epoch_millis(cached_at)},
        {"last_access", epoch_millis(last_access)},
        {"hit_count", hit_count}
    };
}

Json CacheStats::to_json() const {
    return {
        {"total_entries", total_entries},
        {"cache_hits", cache_hits},
        {"cache_misses", cache_misses},
        {"hit_rate", hit_rate},
        {"total_size", total_size},
        {"avg_response_time_ms", avg_response_time.count()},
        {"last_cleanup", last_cleanup.has_value() ? Json(epoch_millis(*last_cleanup)) : Json(nullptr)}
    };
}

ResourceCache::ResourceCache(ResourceCacheConfig config)
    : config_(config)
{}

ResourceCache::~ResourceCache() {
    stop_cleanup();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<Json> ResourceCache::get_resource(
    const std::string& server_name, const std::string& uri, const Fetcher& fetch
) {
    const auto started = std::chrono::steady_clock::now();
    const Key key{server_name, uri};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            const TimePoint now = Clock::now();
            if (expired_locked(it->second, now) == false) {
                it->second.entry.last_access = now;
                it->second.entry.hit_count += 1;
                it->second.access_seq = ++access_counter_;
                record_lookup_locked(true, std::chrono::steady_clock::now() - started);
                get_logger().trace_fmt("Cache hit {} {}", server_name, uri);
                return it->second.entry.content;
            }
            erase_locked(it);
        }
    }

    get_logger().trace_fmt("Cache miss {} {}", server_name, uri);
    ServerResult<Json> fetched = fetch();

    SubscribeHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_lookup_locked(false, std::chrono::steady_clock::now() - started);
        if (fetched.has_value() == false) {
            return fetched;
        }

        const std::size_t size = fetched->dump().size();
        auto existing = entries_.find(key);
        if (existing != entries_.end()) {
            erase_locked(existing);
        }

        if (size > config_.max_size) {
            get_logger().debug_fmt("Not caching {} {}: {} bytes exceeds cache size", server_name, uri, size);
        } else {
            evict_for_locked(size);
            const TimePoint now = Clock::now();
            Slot slot;
            slot.entry = CacheEntry{server_name, uri, *fetched, size, now, now, 0};
            slot.access_seq = ++access_counter_;
            entries_.emplace(key, std::move(slot));
            total_size_ += size;
        }

        if (subscribe_hook_ && subscribed_.insert(key).second) {
            hook = subscribe_hook_;
        }
    }

    if (hook) {
        try {
            hook(server_name, uri);
        } catch (const std::exception& e) {
            get_logger().warn_fmt("Resource subscription for {} {} failed: {}", server_name, uri, e.what());
        }
    }
    return fetched;
}

// ─────────────────────────────────────────────────────────────────────────────
// Invalidation
// ─────────────────────────────────────────────────────────────────────────────

bool ResourceCache::invalidate_resource(const std::string& server_name, const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(Key{server_name, uri});
    if (it == entries_.end()) {
        return false;
    }
    get_logger().debug_fmt("Invalidating cached resource {} {}", server_name, uri);
    erase_locked(it);
    return true;
}

std::size_t ResourceCache::clear_server_cache(const std::string& server_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto current = it++;
        if (current->first.first == server_name) {
            erase_locked(current);
            removed += 1;
        }
    }
    for (auto it = subscribed_.begin(); it != subscribed_.end();) {
        if (it->first == server_name) {
            it = subscribed_.erase(it);
        } else {
            ++it;
        }
    }
    get_logger().info_fmt("Cleared {} cached resources for server {}", removed, server_name);
    return removed;
}

void ResourceCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    subscribed_.clear();
    total_size_ = 0;
    hits_ = 0;
    misses_ = 0;
    avg_response_time_ = Millis{0};
    last_cleanup_ = Clock::now();
    get_logger().info("Cleared entire resource cache");
}

std::size_t ResourceCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = Clock::now();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto current = it++;
        if (expired_locked(current->second, now)) {
            erase_locked(current);
            removed += 1;
        }
    }
    last_cleanup_ = now;
    if (removed > 0) {
        get_logger().info_fmt("Cleaned up {} expired cache entries", removed);
    }
    return removed;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CacheEntry> ResourceCache::list_resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheEntry> out;
    out.reserve(entries_.size());
    for (const auto& [key, slot] : entries_) {
        out.push_back(slot.entry);
    }
    return out;
}

CacheStats ResourceCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.total_entries = entries_.size();
    stats.cache_hits = hits_;
    stats.cache_misses = misses_;
    const std::uint64_t lookups = hits_ + misses_;
    if (lookups > 0) {
        const double percent = static_cast<double>(hits_) / static_cast<double>(lookups) * 100.0;
        stats.hit_rate = std::round(percent * 100.0) / 100.0;
    }
    stats.total_size = total_size_;
    stats.avg_response_time = avg_response_time_;
    stats.last_cleanup = last_cleanup_;
    return stats;
}

void ResourceCache::set_subscribe_hook(SubscribeHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribe_hook_ = std::move(hook);
}

// ─────────────────────────────────────────────────────────────────────────────
// Periodic cleanup
// ─────────────────────────────────────────────────────────────────────────────

void ResourceCache::start_cleanup(asio::any_io_executor executor) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (cleanup_timer_ != nullptr && cleanup_timer_->is_running()) {
        return;
    }
    cleanup_timer_ = std::make_unique<PeriodicTimer>(std::move(executor), config_.cleanup_interval, [this] {
        (void)cleanup_expired();
    });
    cleanup_timer_->start();
}

void ResourceCache::stop_cleanup() {
    std::unique_ptr<PeriodicTimer> timer;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer = std::move(cleanup_timer_);
    }
    if (timer != nullptr) {
        timer->stop();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals (mutex_ held)
// ─────────────────────────────────────────────────────────────────────────────

bool ResourceCache::expired_locked(const Slot& slot, TimePoint now) const {
    return now - slot.entry.cached_at >= config_.ttl;
}

void ResourceCache::erase_locked(std::map<Key, Slot>::iterator it) {
    total_size_ -= it->second.entry.size;
    entries_.erase(it);
}

void ResourceCache::evict_for_locked(std::size_t incoming) {
    while (entries_.empty() == false && total_size_ + incoming > config_.max_size) {
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.access_seq < oldest->second.access_seq) {
                oldest = it;
            }
        }
        get_logger().debug_fmt("Evicting {} {} ({} bytes)",
            oldest->first.first, oldest->first.second, oldest->second.entry.size);
        erase_locked(oldest);
    }
}

void ResourceCache::record_lookup_locked(bool hit, Millis elapsed) {
    if (hit) {
        hits_ += 1;
    } else {
        misses_ += 1;
    }
    const auto lookups = static_cast<double>(hits_ + misses_);
    avg_response_time_ += (elapsed - avg_response_time_) / lookups;
}

}  // namespace mcpchat
