/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Options Implementation
 */

#include "middleware/cache_options.hpp"

namespace pagestash::middleware {

CacheOptions options_from_config(const config::Config& config) {
    const auto& mw = config.cache_middleware;

    CacheOptions options;
    options.cache_alias = mw.alias;
    options.key_prefix = mw.key_prefix;
    options.cache_timeout = std::chrono::seconds(mw.seconds);
    options.anonymous_only = mw.anonymous_only;
    options.identity_available = config.auth.enabled;
    options.use_etags = mw.use_etags;
    options.head_uses_get_entries = mw.head_uses_get_entries;

    options.key_context.use_i18n = config.i18n.use_i18n;
    options.key_context.language_code = config.i18n.language_code;
    options.key_context.use_tz = config.i18n.use_tz;
    options.key_context.time_zone = config.i18n.time_zone;
    return options;
}

} // namespace pagestash::middleware
