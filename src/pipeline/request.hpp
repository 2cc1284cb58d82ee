/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Request - Pipeline view of an incoming HTTP request
 *
 * Wraps the Boost.Beast request message and carries the request-scoped state
 * the cache phases need: resolved locale/time zone, the lazily materialized
 * session, the identity, and the should-store decision taken by the fetch
 * phase.
 */

#ifndef PAGESTASH_PIPELINE_REQUEST_HPP
#define PAGESTASH_PIPELINE_REQUEST_HPP

#include <boost/beast/http.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pagestash::pipeline {

namespace beast = boost::beast;
namespace http = beast::http;

/**
 * Session capability
 *
 * accessed() reports whether something during this request touched the
 * session; asking must not materialize it.
 */
class Session {
public:
    virtual ~Session() = default;
    virtual bool accessed() const = 0;
};

/**
 * Identity capability provided by the authentication subsystem
 */
class Identity {
public:
    virtual ~Identity() = default;
    virtual bool is_authenticated() const = 0;
};

/**
 * Canonical request-header name: "HTTP_" + name uppercased, '-' -> '_'
 *
 * "Accept-Language" -> "HTTP_ACCEPT_LANGUAGE"
 */
std::string canonical_header_name(std::string_view name);

/**
 * HTTP request as seen by the cache layer
 */
struct Request {
    http::request<http::string_body> message;
    std::string remote_addr;                   // Client address, empty if unknown

    std::optional<std::string> language_code;  // Set by locale resolution
    std::optional<std::string> time_zone;      // Set by time zone resolution

    std::shared_ptr<Session> session;          // Null when sessions are not installed
    std::shared_ptr<Identity> user;            // Null when authentication is not installed

    // Unset until the fetch phase ran; the update phase stores only when true
    std::optional<bool> should_store;

    // Set by the fetch phase when the response came from the cache
    bool served_from_cache{false};

    Request() = default;
    Request(http::verb method, std::string_view target);

    /**
     * Method name as sent ("GET", "HEAD", ...)
     */
    std::string method() const;

    /**
     * Path including the query string, as received
     */
    std::string full_path() const;

    /**
     * Value of the header whose canonical name is `canonical_name`
     */
    std::optional<std::string> meta(std::string_view canonical_name) const;

    /**
     * Set a request header
     */
    Request& set_header(std::string_view name, std::string_view value);

    /**
     * True if a session is attached and was accessed while handling the request
     */
    bool session_accessed() const;

    /**
     * "HIT" if served from the cache, "MISS" if the generated response was a
     * store candidate, "BYPASS" otherwise
     */
    std::string_view cache_status() const;
};

} // namespace pagestash::pipeline

#endif // PAGESTASH_PIPELINE_REQUEST_HPP
