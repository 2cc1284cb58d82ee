/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Key - XXH3-based header-list and page keys
 *
 * Two kinds of keys are derived from a request:
 * - the header-list key identifies a path (plus locale/time zone) and is
 *   used to find which request headers the path varies on
 * - the page key identifies one response variant: path, method, and the
 *   request's values for the headers in the learned header list
 */

#ifndef PAGESTASH_CACHE_CACHE_KEY_HPP
#define PAGESTASH_CACHE_CACHE_KEY_HPP

#include "pipeline/request.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pagestash::cache {

/**
 * Ordered canonical request-header names ("HTTP_ACCEPT_LANGUAGE", ...)
 */
using HeaderList = std::vector<std::string>;

/**
 * Deployment-level locale/time zone partitioning of keys
 */
struct KeyContext {
    bool use_i18n{false};
    std::string language_code{"en-us"};   // Fallback when the request has none
    bool use_tz{false};
    std::string time_zone{"UTC"};         // Fallback when the request has none
};

/**
 * Normalize a request target into an absolute path plus query
 *
 * Strips an absolute-form "scheme://authority" prefix, percent-encodes bytes
 * that may not appear in a URI and upper-cases existing percent escapes.
 * "/caf\xC3\xA9?q=%2f" -> "/caf%C3%A9?q=%2F"
 */
std::string normalize_path(std::string_view target);

/**
 * XXH3 128-bit digest of `data` as 32 lowercase hex characters
 */
std::string hash_hex(std::string_view data);

/**
 * Key of the header list learned for the request's path
 *
 * Never consults header values, so it can be computed before the handler
 * runs.
 */
std::string header_list_key(std::string_view key_prefix,
                            const pipeline::Request& request,
                            const KeyContext& context);

/**
 * Key of one response variant
 *
 * Hashes the request's values for exactly the headers in `header_list`, in
 * list order; missing headers contribute nothing.
 *
 * Values are concatenated without framing, so ("ab", "c") and ("a", "bc")
 * share a key and an absent header equals an empty one.
 */
std::string page_key(const pipeline::Request& request,
                     std::string_view method,
                     const HeaderList& header_list,
                     std::string_view key_prefix,
                     const KeyContext& context);

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_CACHE_KEY_HPP
