/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * LRU Cache Implementation
 */

#include "cache/lru_cache.hpp"

#include "util/logger.hpp"

namespace pagestash::cache {

using util::log_component::Cache;

LruCache::LruCache(const LruCacheConfig& config)
    : config_(config) {
    PAGESTASH_LOG_DEBUG(Cache, "locmem storage: max_size={}MB, default_timeout={}s",
                        config_.max_size_bytes / (1024 * 1024),
                        config_.default_timeout.count());
}

std::optional<std::string> LruCache::get(const std::string& key) {
    std::string value;

    {
        std::shared_lock<std::shared_mutex> read_lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (is_expired(it->second->entry)) {
            read_lock.unlock();

            std::unique_lock<std::shared_mutex> write_lock(mutex_);
            // A concurrent set() may have refreshed it between the locks
            it = cache_map_.find(key);
            if (it != cache_map_.end() && is_expired(it->second->entry)) {
                erase_node(it);
                ++expired_;
            }
            ++misses_;
            return std::nullopt;
        }

        value = it->second->entry.value;
    }

    // Refresh LRU position; the entry may have been replaced or evicted meanwhile
    {
        std::unique_lock<std::shared_mutex> write_lock(mutex_);
        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            touch_node(it->second);
        }
    }

    ++hits_;
    return value;
}

void LruCache::set(const std::string& key, std::string value, std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        remove(key);
        return;
    }

    std::size_t entry_size = key.size() + value.size();

    // Storing it would evict everything else and still not fit
    if (entry_size > config_.max_size_bytes) {
        PAGESTASH_LOG_DEBUG(Cache, "Cache entry too large: {} bytes > {} max",
                            entry_size, config_.max_size_bytes);
        return;
    }

    auto now = std::chrono::steady_clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        std::size_t old_size = it->second->entry.size_bytes;
        it->second->entry.value = std::move(value);
        it->second->entry.size_bytes = entry_size;
        it->second->entry.expires_at = now + ttl;

        current_size_bytes_ = current_size_bytes_ - old_size + entry_size;

        touch_node(it->second);

        PAGESTASH_LOG_TRACE(Cache, "Cache entry updated: key={}, size={}", key, entry_size);
    } else {
        Node node;
        node.key = key;
        node.entry.value = std::move(value);
        node.entry.size_bytes = entry_size;
        node.entry.expires_at = now + ttl;

        lru_list_.push_front(std::move(node));
        cache_map_[key] = lru_list_.begin();

        current_size_bytes_ += entry_size;

        PAGESTASH_LOG_TRACE(Cache, "Cache entry added: key={}, size={}, total_size={}",
                            key, entry_size, current_size_bytes_.load());
    }

    evict_if_needed();
}

bool LruCache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        return false;
    }

    erase_node(it);

    PAGESTASH_LOG_TRACE(Cache, "Cache entry removed: key={}", key);
    return true;
}

void LruCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = cache_map_.size();
    cache_map_.clear();
    lru_list_.clear();
    current_size_bytes_ = 0;

    PAGESTASH_LOG_INFO(Cache, "Cache cleared: {} entries removed", count);
}

CacheStats LruCache::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = cache_map_.size();
    stats.size_bytes = current_size_bytes_.load();
    stats.max_size_bytes = config_.max_size_bytes;

    return stats;
}

void LruCache::touch_node(typename LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void LruCache::evict_if_needed() {
    while (current_size_bytes_ > config_.max_size_bytes && !lru_list_.empty()) {
        auto& lru_node = lru_list_.back();

        PAGESTASH_LOG_DEBUG(Cache, "Evicting cache entry: key={}, size={}",
                            lru_node.key, lru_node.entry.size_bytes);

        current_size_bytes_ -= lru_node.entry.size_bytes;
        cache_map_.erase(lru_node.key);
        lru_list_.pop_back();

        ++evictions_;
    }
}

void LruCache::erase_node(typename CacheMap::iterator it) {
    current_size_bytes_ -= it->second->entry.size_bytes;
    lru_list_.erase(it->second);
    cache_map_.erase(it);
}

bool LruCache::is_expired(const CacheEntry& entry) {
    return std::chrono::steady_clock::now() >= entry.expires_at;
}

} // namespace pagestash::cache
