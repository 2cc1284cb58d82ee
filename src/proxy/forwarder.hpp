/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Request Forwarder - Generates responses on a cache miss by asking the origin
 */

#ifndef PAGESTASH_PROXY_FORWARDER_HPP
#define PAGESTASH_PROXY_FORWARDER_HPP

#include "config/config.hpp"
#include "pipeline/request.hpp"
#include "pipeline/response.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace pagestash::proxy {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

struct ForwarderConfig {
    std::string host{"localhost"};
    std::uint16_t port{8000};
    std::chrono::seconds request_timeout{30};
    bool add_forwarded_headers{true};             // X-Forwarded-For, X-Real-IP

    static ForwarderConfig from_settings(const config::UpstreamSettings& settings);
};

/**
 * Result of forwarding one request
 */
struct ForwardResult {
    bool success{false};
    pipeline::Response response;
    std::string error_message;
    std::chrono::milliseconds latency{0};
};

/**
 * Synchronous HTTP/1.1 client for the single upstream origin
 *
 * Every call opens its own connection, so one forwarder may be shared by all
 * worker threads. Transport failures become 502/504 responses.
 */
class Forwarder {
public:
    explicit Forwarder(const ForwarderConfig& config);

    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

    ForwardResult forward(const pipeline::Request& request);

    /**
     * Handler adapter: the response of forward(), error or not
     */
    pipeline::Response operator()(pipeline::Request& request) { return forward(request).response; }

    const ForwarderConfig& config() const { return config_; }

    /**
     * Request sent to the origin: method, target and end-to-end headers of
     * `request`, Host rewritten to the origin, proxy headers appended
     */
    http::request<http::string_body> build_upstream_request(const pipeline::Request& request) const;

    /**
     * Response handed back to the pipeline, without hop-by-hop headers
     */
    static pipeline::Response to_pipeline_response(http::response<http::string_body> response);

private:
    ForwarderConfig config_;
};

} // namespace pagestash::proxy

#endif // PAGESTASH_PROXY_FORWARDER_HPP
