/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Headers - Cache-Control, Vary and freshness header helpers
 */

#ifndef PAGESTASH_CACHE_CACHE_HEADERS_HPP
#define PAGESTASH_CACHE_CACHE_HEADERS_HPP

#include "cache/cache_key.hpp"
#include "pipeline/response.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagestash::cache {

/**
 * One Cache-Control directive; valueless directives ("no-cache") have no value
 */
using CacheDirective = std::pair<std::string, std::optional<std::string>>;

/**
 * Split a comma-delimited header value, trimming whitespace around each token.
 * Empty tokens are dropped; order is preserved.
 */
std::vector<std::string> split_header_tokens(std::string_view value);

/**
 * Parse a Cache-Control value into lowercased directives, in order
 */
std::vector<CacheDirective> parse_cache_control(std::string_view value);

/**
 * max-age of the response's Cache-Control header
 *
 * nullopt if the header or the directive is absent, or if its value is not an
 * integer. Negative values are reported as zero.
 */
std::optional<std::chrono::seconds> get_max_age(const pipeline::Response& response);

/**
 * Set max-age on the response's Cache-Control header, keeping the smaller of
 * an existing max-age and `max_age`; other directives are preserved
 */
void patch_cache_control_max_age(pipeline::Response& response, std::chrono::seconds max_age);

/**
 * RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT")
 */
std::string http_date(std::chrono::system_clock::time_point time);

/**
 * Add ETag, Last-Modified, Expires and Cache-Control max-age for `timeout`
 *
 * Headers already present are left alone, so patching twice with the same
 * timeout is the same as patching once. For a deferred response the ETag is
 * computed when the body is rendered.
 */
void patch_response_headers(pipeline::Response& response,
                            std::chrono::seconds timeout,
                            bool use_etags,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/**
 * Header list declared by the response's Vary header, in declaration order.
 * Empty if the response has no Vary header.
 */
HeaderList vary_header_list(const pipeline::Response& response);

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_CACHE_HEADERS_HPP
