/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Combined Cache - Fetch and update phases wrapped around one handler
 *
 * Settings resolve as explicit override > deployment value > built-in
 * default. The key prefix is also the key prefix of the backend view. The
 * timeout override (or, without an alias override, the deployment timeout)
 * becomes the view's default timeout, which is then the TTL used when a
 * response sends no max-age.
 */

#ifndef PAGESTASH_MIDDLEWARE_COMBINED_CACHE_HPP
#define PAGESTASH_MIDDLEWARE_COMBINED_CACHE_HPP

#include "cache/registry.hpp"
#include "config/config.hpp"
#include "middleware/fetch_phase.hpp"
#include "middleware/update_phase.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pagestash::middleware {

struct CombinedCacheOverrides {
    std::optional<std::string> key_prefix;
    std::optional<std::string> cache_alias;
    std::optional<std::chrono::seconds> cache_timeout;
    std::optional<bool> anonymous_only;
};

class CombinedCache {
public:
    using Handler = std::function<pipeline::Response(pipeline::Request&)>;

    /**
     * @throws config::ConfigError on an unknown alias, or anonymous_only
     *         without the authentication subsystem
     */
    CombinedCache(const config::Config& config,
                  const cache::CacheRegistry& registry,
                  const CombinedCacheOverrides& overrides = {});

    /**
     * Serve from the cache, or run `handler` and store its response
     */
    pipeline::Response handle(pipeline::Request& request, const Handler& handler);

    const CacheOptions& options() const { return options_; }

private:
    struct Resolved {
        CacheOptions options;
        std::shared_ptr<cache::CacheBackend> backend;
    };

    static Resolved resolve(const config::Config& config,
                            const cache::CacheRegistry& registry,
                            const CombinedCacheOverrides& overrides);

    explicit CombinedCache(Resolved resolved);

    CacheOptions options_;
    FetchPhase fetch_;
    UpdatePhase update_;
};

} // namespace pagestash::middleware

#endif // PAGESTASH_MIDDLEWARE_COMBINED_CACHE_HPP
