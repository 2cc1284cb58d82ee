/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Options - Resolved settings shared by the fetch and update phases
 */

#ifndef PAGESTASH_MIDDLEWARE_CACHE_OPTIONS_HPP
#define PAGESTASH_MIDDLEWARE_CACHE_OPTIONS_HPP

#include "cache/cache_key.hpp"
#include "config/config.hpp"

#include <chrono>
#include <string>

namespace pagestash::middleware {

struct CacheOptions {
    std::string cache_alias{"default"};
    std::string key_prefix;
    std::chrono::seconds cache_timeout{600};  // TTL when the response sends no max-age
    bool anonymous_only{false};
    bool identity_available{false};           // Authentication subsystem is installed
    bool use_etags{true};
    bool head_uses_get_entries{true};
    cache::KeyContext key_context;
};

/**
 * Options of a phase installed on its own: deployment values, no overrides
 */
CacheOptions options_from_config(const config::Config& config);

} // namespace pagestash::middleware

#endif // PAGESTASH_MIDDLEWARE_CACHE_OPTIONS_HPP
