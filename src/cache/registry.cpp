/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Registry Implementation
 */

#include "cache/registry.hpp"
#include "cache/lru_cache.hpp"
#include "util/logger.hpp"

namespace pagestash::cache {

using util::log_component::Cache;

KeyedCache::KeyedCache(std::shared_ptr<CacheBackend> storage, std::string key_prefix,
                       int version, std::chrono::seconds default_timeout)
    : storage_(std::move(storage))
    , key_prefix_(std::move(key_prefix))
    , version_(version)
    , default_timeout_(default_timeout)
{
}

std::string KeyedCache::make_key(const std::string& key) const {
    return key_prefix_ + ":" + std::to_string(version_) + ":" + key;
}

std::optional<std::string> KeyedCache::get(const std::string& key) {
    auto full_key = make_key(key);
    warn_if_not_portable(full_key);
    return storage_->get(full_key);
}

void KeyedCache::set(const std::string& key, std::string value, std::chrono::seconds ttl) {
    auto full_key = make_key(key);
    warn_if_not_portable(full_key);
    storage_->set(full_key, std::move(value), ttl);
}

void KeyedCache::warn_if_not_portable(const std::string& full_key) const {
    if (full_key.size() > max_portable_key_length) {
        PAGESTASH_LOG_WARN(Cache, "Cache key longer than {} bytes is not portable: {}",
                           max_portable_key_length, full_key);
        return;
    }
    for (char c : full_key) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 32 || uc == 127) {
            PAGESTASH_LOG_WARN(Cache, "Cache key contains characters that are not portable: {}",
                               full_key);
            return;
        }
    }
}

CacheRegistry::CacheRegistry(const std::map<std::string, config::CacheBackendSettings>& caches) {
    for (const auto& [alias, settings] : caches) {
        Registered registered;
        registered.settings = settings;

        auto timeout = std::chrono::seconds(settings.timeout_seconds);
        if (settings.backend == "locmem") {
            LruCacheConfig lru_config;
            lru_config.max_size_bytes = settings.max_size_mb * 1024 * 1024;
            lru_config.default_timeout = timeout;
            registered.storage = std::make_shared<LruCache>(lru_config);
        } else if (settings.backend == "dummy") {
            registered.storage = std::make_shared<DummyCache>(timeout);
        } else {
            throw config::ConfigError("unknown cache backend '" + settings.backend +
                                      "' for alias '" + alias + "'");
        }

        PAGESTASH_LOG_DEBUG(Cache, "Registered cache '{}' ({}, timeout={}s)",
                            alias, settings.backend, settings.timeout_seconds);
        backends_.emplace(alias, std::move(registered));
    }
}

std::shared_ptr<CacheBackend> CacheRegistry::get(const std::string& alias,
                                                 const BackendOverrides& overrides) const {
    auto it = backends_.find(alias);
    if (it == backends_.end()) {
        throw config::ConfigError("cache alias '" + alias + "' is not configured");
    }

    const auto& settings = it->second.settings;
    return std::make_shared<KeyedCache>(
        it->second.storage,
        overrides.key_prefix.value_or(settings.key_prefix),
        settings.version,
        overrides.timeout.value_or(std::chrono::seconds(settings.timeout_seconds)));
}

std::shared_ptr<CacheBackend> CacheRegistry::storage(const std::string& alias) const {
    auto it = backends_.find(alias);
    return it == backends_.end() ? nullptr : it->second.storage;
}

std::vector<std::string> CacheRegistry::aliases() const {
    std::vector<std::string> result;
    result.reserve(backends_.size());
    for (const auto& [alias, registered] : backends_) {
        result.push_back(alias);
    }
    return result;
}

} // namespace pagestash::cache
