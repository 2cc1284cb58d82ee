/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Registry - Backend selection by alias
 *
 * Each configured alias owns one storage instance. Callers receive a keyed
 * view over it that applies the key prefix, the key version and a default
 * timeout, so several views with different prefixes can share one storage.
 */

#ifndef PAGESTASH_CACHE_REGISTRY_HPP
#define PAGESTASH_CACHE_REGISTRY_HPP

#include "cache/cache_backend.hpp"
#include "config/config.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pagestash::cache {

/**
 * Per-view overrides of the alias' configured settings
 */
struct BackendOverrides {
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::string> key_prefix;
};

/**
 * View over a storage backend: "<prefix>:<version>:<key>"
 */
class KeyedCache : public CacheBackend {
public:
    /**
     * Keys longer than this, or containing control characters or spaces,
     * are not portable to memcached-style backends
     */
    static constexpr std::size_t max_portable_key_length = 250;

    KeyedCache(std::shared_ptr<CacheBackend> storage, std::string key_prefix,
               int version, std::chrono::seconds default_timeout);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, std::string value, std::chrono::seconds ttl) override;
    std::chrono::seconds default_timeout() const override { return default_timeout_; }

    std::string make_key(const std::string& key) const;

    const std::string& key_prefix() const { return key_prefix_; }

private:
    void warn_if_not_portable(const std::string& full_key) const;

    std::shared_ptr<CacheBackend> storage_;
    std::string key_prefix_;
    int version_;
    std::chrono::seconds default_timeout_;
};

class CacheRegistry {
public:
    /**
     * Build one storage per alias
     * @throws config::ConfigError on an unknown backend type
     */
    explicit CacheRegistry(const std::map<std::string, config::CacheBackendSettings>& caches);

    /**
     * Keyed view over the storage registered under `alias`
     * @throws config::ConfigError if the alias is not configured
     */
    std::shared_ptr<CacheBackend> get(const std::string& alias,
                                      const BackendOverrides& overrides = {}) const;

    /**
     * Raw storage registered under `alias`, or nullptr
     */
    std::shared_ptr<CacheBackend> storage(const std::string& alias) const;

    std::vector<std::string> aliases() const;

private:
    struct Registered {
        config::CacheBackendSettings settings;
        std::shared_ptr<CacheBackend> storage;
    };

    std::map<std::string, Registered> backends_;
};

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_REGISTRY_HPP
