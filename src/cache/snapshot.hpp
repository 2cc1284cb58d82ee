/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Snapshot - Serialized form of cached header lists and responses
 *
 * Backends store opaque strings. Header lists are stored as a JSON array of
 * canonical names. Responses are stored as CBOR (the body may be binary) of
 *   {"status":200,"version":11,"headers":[["Name","value"],...],"body":<bytes>}
 */

#ifndef PAGESTASH_CACHE_SNAPSHOT_HPP
#define PAGESTASH_CACHE_SNAPSHOT_HPP

#include "cache/cache_key.hpp"
#include "pipeline/response.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pagestash::cache {

std::string encode_header_list(const HeaderList& header_list);

/**
 * @return nullopt if `data` is not a JSON array of strings
 */
std::optional<HeaderList> decode_header_list(std::string_view data);

/**
 * Serialize a finalized response (status, headers in wire order, body)
 */
std::string encode_response(const pipeline::Response& response);

/**
 * Rebuild an independent response from a stored snapshot
 * @return nullopt if `data` is not a well-formed snapshot
 */
std::optional<pipeline::Response> decode_response(std::string_view data);

} // namespace pagestash::cache

#endif // PAGESTASH_CACHE_SNAPSHOT_HPP
