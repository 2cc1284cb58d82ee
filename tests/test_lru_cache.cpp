/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Tests for the in-process LRU backend
 */

#include "cache/lru_cache.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace pagestash::cache;
using std::chrono::seconds;

namespace {

LruCacheConfig small_config(std::size_t max_size_bytes) {
    LruCacheConfig config;
    config.max_size_bytes = max_size_bytes;
    config.default_timeout = seconds(300);
    return config;
}

} // namespace

TEST(LruCache, GetMissingKeyCountsMiss) {
    LruCache cache(small_config(1024));
    EXPECT_FALSE(cache.get("absent").has_value());
    EXPECT_EQ(cache.get_stats().misses, 1u);
}

TEST(LruCache, StoresAndReturnsValues) {
    LruCache cache(small_config(1024));
    cache.set("k", "v", seconds(60));

    EXPECT_EQ(cache.get("k"), "v");
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.size_bytes, 2u);
}

TEST(LruCache, OverwriteReplacesValueAndSize) {
    LruCache cache(small_config(1024));
    cache.set("k", "short", seconds(60));
    cache.set("k", "much longer", seconds(60));

    EXPECT_EQ(cache.get("k"), "much longer");
    EXPECT_EQ(cache.get_stats().size_bytes, 1u + 11u);
}

TEST(LruCache, NonPositiveTtlStoresNothing) {
    LruCache cache(small_config(1024));
    cache.set("k", "v", seconds(60));
    cache.set("k", "v2", seconds(0));

    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.get_stats().entries, 0u);
}

TEST(LruCache, ExpiredEntriesAreNotReturned) {
    LruCache cache(small_config(1024));
    cache.set("k", "v", seconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(cache.get("k").has_value());
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.expired, 1u);
    EXPECT_EQ(stats.entries, 0u);
}

TEST(LruCache, EvictsLeastRecentlyUsed) {
    // Each entry is 1 (key) + 4 (value) bytes; room for two
    LruCache cache(small_config(10));
    cache.set("a", "aaaa", seconds(60));
    cache.set("b", "bbbb", seconds(60));

    ASSERT_TRUE(cache.get("a").has_value());  // b is now least recently used
    cache.set("c", "cccc", seconds(60));

    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
    EXPECT_EQ(cache.get_stats().evictions, 1u);
}

TEST(LruCache, RejectsEntriesLargerThanCapacity) {
    LruCache cache(small_config(4));
    cache.set("key", "value", seconds(60));
    EXPECT_FALSE(cache.get("key").has_value());
}

TEST(LruCache, RemoveAndClear) {
    LruCache cache(small_config(1024));
    cache.set("a", "1", seconds(60));
    cache.set("b", "2", seconds(60));

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    cache.clear();
    EXPECT_EQ(cache.get_stats().entries, 0u);
    EXPECT_EQ(cache.get_stats().size_bytes, 0u);
}

TEST(LruCache, ConcurrentReadersAndWriters) {
    LruCache cache(small_config(1024 * 1024));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                auto key = "k" + std::to_string((t * 500 + i) % 64);
                cache.set(key, std::to_string(i), seconds(60));
                auto value = cache.get(key);
                (void)value;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.get_stats().entries, 64u);
}
