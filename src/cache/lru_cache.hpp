/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * LRU Cache - In-process storage for the "locmem" backend
 *
 * Header lists and response snapshots of one worker process live here,
 * bounded by the byte size of keys plus values.
 */

#ifndef PAGESTASH_CACHE_LRU_CACHE_HPP
#define PAGESTASH_CACHE_LRU_CACHE_HPP

#include "cache/cache_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pagestash::cache {

struct CacheEntry {
    std::string value;
    std::size_t size_bytes{0};     // Key plus value
    std::chrono::steady_clock::time_point expires_at;
};

/**
 * Counters reported under /cache/stats for each locmem alias
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t expired{0};

    std::size_t entries{0};
    std::size_t size_bytes{0};
    std::size_t max_size_bytes{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

struct LruCacheConfig {
    std::size_t max_size_bytes{64 * 1024 * 1024};
    std::chrono::seconds default_timeout{300};      // Used when a view sets no timeout
};

/**
 * Backend holding opaque string values until their TTL passes
 *
 * Expired entries are dropped when read. A write that pushes the total
 * size over max_size_bytes evicts least recently read entries first; a
 * single value larger than the limit is not stored at all.
 */
class LruCache : public CacheBackend {
public:
    explicit LruCache(const LruCacheConfig& config);
    ~LruCache() override = default;

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;
    LruCache(LruCache&&) = delete;
    LruCache& operator=(LruCache&&) = delete;

    std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, std::string value, std::chrono::seconds ttl) override;

    std::chrono::seconds default_timeout() const override { return config_.default_timeout; }

    // false if the key was not present
    bool remove(const std::string& key);

    void clear();

    CacheStats get_stats() const;

private:
    struct Node {
        std::string key;
        CacheEntry entry;
    };

    using LruList = std::list<Node>;
    using CacheMap = std::unordered_map<std::string, typename LruList::iterator>;

    // The three helpers below require the exclusive lock
    void touch_node(typename LruList::iterator it);
    void evict_if_needed();
    void erase_node(typename CacheMap::iterator it);

    static bool is_expired(const CacheEntry& entry);

    mutable std::shared_mutex mutex_;
    LruCacheConfig config_;

    LruList lru_list_;  // Most recently read first
    CacheMap cache_map_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::atomic<std::size_t> current_size_bytes_{0};
};

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_LRU_CACHE_HPP
