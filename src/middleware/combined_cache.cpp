/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Combined Cache Implementation
 */

#include "middleware/combined_cache.hpp"
#include "util/logger.hpp"

namespace pagestash::middleware {

using util::log_component::Cache;

CombinedCache::Resolved CombinedCache::resolve(const config::Config& config,
                                               const cache::CacheRegistry& registry,
                                               const CombinedCacheOverrides& overrides) {
    const auto& mw = config.cache_middleware;

    Resolved resolved;
    auto& options = resolved.options;
    options = options_from_config(config);
    options.key_prefix = overrides.key_prefix.value_or(mw.key_prefix);
    options.cache_alias = overrides.cache_alias.value_or(mw.alias);
    options.anonymous_only = overrides.anonymous_only.value_or(mw.anonymous_only);

    cache::BackendOverrides backend_overrides;
    backend_overrides.key_prefix = options.key_prefix;
    if (overrides.cache_alias) {
        // An explicit alias keeps that backend's own timeout unless overridden
        backend_overrides.timeout = overrides.cache_timeout;
    } else {
        backend_overrides.timeout = overrides.cache_timeout.value_or(std::chrono::seconds(mw.seconds));
    }

    resolved.backend = registry.get(options.cache_alias, backend_overrides);
    options.cache_timeout = resolved.backend->default_timeout();
    return resolved;
}

CombinedCache::CombinedCache(const config::Config& config,
                             const cache::CacheRegistry& registry,
                             const CombinedCacheOverrides& overrides)
    : CombinedCache(resolve(config, registry, overrides))
{
}

CombinedCache::CombinedCache(Resolved resolved)
    : options_(resolved.options)
    , fetch_(resolved.options, resolved.backend)
    , update_(resolved.options, resolved.backend)
{
    PAGESTASH_LOG_INFO(Cache, "Page cache on '{}' (prefix='{}', timeout={}s, anonymous_only={})",
                       options_.cache_alias, options_.key_prefix, options_.cache_timeout.count(),
                       options_.anonymous_only);
}

pipeline::Response CombinedCache::handle(pipeline::Request& request, const Handler& handler) {
    if (auto cached = fetch_.lookup(request)) {
        return std::move(*cached);
    }

    auto response = handler(request);
    update_.maybe_store(request, response);
    return response;
}

} // namespace pagestash::middleware
