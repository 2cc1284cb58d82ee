/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Tests for backend selection by alias and keyed views
 */

#include "cache/lru_cache.hpp"
#include "cache/registry.hpp"

#include <gtest/gtest.h>

using namespace pagestash;
using std::chrono::seconds;

namespace {

std::map<std::string, config::CacheBackendSettings> two_caches() {
    config::CacheBackendSettings locmem;
    locmem.timeout_seconds = 120;
    locmem.key_prefix = "site";
    locmem.version = 2;

    config::CacheBackendSettings dummy;
    dummy.backend = "dummy";

    return {{"default", locmem}, {"null", dummy}};
}

} // namespace

TEST(CacheRegistry, BuildsBackendPerAlias) {
    cache::CacheRegistry registry(two_caches());

    EXPECT_NE(std::dynamic_pointer_cast<cache::LruCache>(registry.storage("default")), nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<cache::DummyCache>(registry.storage("null")), nullptr);
    EXPECT_EQ(registry.storage("missing"), nullptr);
    EXPECT_EQ(registry.aliases(), (std::vector<std::string>{"default", "null"}));
}

TEST(CacheRegistry, UnknownAliasOrBackendIsConfigError) {
    cache::CacheRegistry registry(two_caches());
    EXPECT_THROW(registry.get("missing"), config::ConfigError);

    config::CacheBackendSettings bogus;
    bogus.backend = "memcached";
    std::map<std::string, config::CacheBackendSettings> caches{{"default", bogus}};
    EXPECT_THROW(cache::CacheRegistry rejected(caches), config::ConfigError);
}

TEST(CacheRegistry, ViewAppliesPrefixVersionAndTimeout) {
    cache::CacheRegistry registry(two_caches());
    auto view = registry.get("default");

    EXPECT_EQ(view->default_timeout(), seconds(120));
    view->set("page", "v", seconds(60));

    EXPECT_EQ(registry.storage("default")->get("site:2:page"), "v");
    EXPECT_EQ(view->get("page"), "v");
}

TEST(CacheRegistry, OverridesReplacePrefixAndTimeout) {
    cache::CacheRegistry registry(two_caches());

    cache::BackendOverrides overrides;
    overrides.key_prefix = "other";
    overrides.timeout = seconds(5);
    auto view = registry.get("default", overrides);

    EXPECT_EQ(view->default_timeout(), seconds(5));
    view->set("page", "v", seconds(60));
    EXPECT_EQ(registry.storage("default")->get("other:2:page"), "v");

    // Views with different prefixes do not see each other's entries
    EXPECT_FALSE(registry.get("default")->get("page").has_value());
}

TEST(CacheRegistry, DummyBackendStoresNothing) {
    cache::CacheRegistry registry(two_caches());
    auto view = registry.get("null");

    view->set("page", "v", seconds(60));
    EXPECT_FALSE(view->get("page").has_value());
}
