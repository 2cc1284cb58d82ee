/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Backend - Key/value store contract consumed by the cache phases
 *
 * Values are opaque strings; the phases serialize header lists and response
 * snapshots before writing (see cache/snapshot.hpp). Individual get/set calls
 * must be atomic; no multi-key transactions are assumed.
 */

#ifndef PAGESTASH_CACHE_CACHE_BACKEND_HPP
#define PAGESTASH_CACHE_CACHE_BACKEND_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace pagestash::cache {

/**
 * Raised by backends when a read or write cannot be carried out
 */
class CacheBackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /**
     * @return Stored value, or nullopt if absent or expired
     * @throws CacheBackendError on backend failure
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Store `value` under `key` for `ttl`. A non-positive ttl stores nothing.
     * @throws CacheBackendError on backend failure
     */
    virtual void set(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

    /**
     * TTL applied by callers that have no better timeout
     */
    virtual std::chrono::seconds default_timeout() const = 0;
};

/**
 * Backend that stores nothing ("dummy" in configuration)
 */
class DummyCache : public CacheBackend {
public:
    explicit DummyCache(std::chrono::seconds default_timeout)
        : default_timeout_(default_timeout) {}

    std::optional<std::string> get(const std::string&) override { return std::nullopt; }
    void set(const std::string&, std::string, std::chrono::seconds) override {}
    std::chrono::seconds default_timeout() const override { return default_timeout_; }

private:
    std::chrono::seconds default_timeout_;
};

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_CACHE_BACKEND_HPP
