/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Request Forwarder implementation
 */

#include "proxy/forwarder.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <set>

namespace pagestash::proxy {

using util::log_component::Upstream;

namespace {

// Headers that describe a single connection and are never forwarded
const std::set<http::field>& hop_by_hop_fields() {
    static const std::set<http::field> fields = {
        http::field::connection,
        http::field::keep_alive,
        http::field::proxy_authenticate,
        http::field::proxy_authorization,
        http::field::te,
        http::field::trailer,
        http::field::transfer_encoding,
        http::field::upgrade,
    };
    return fields;
}

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

pipeline::Response error_response(http::status status, const std::string& message) {
    return pipeline::Response(status, R"({"error": ")" + message + R"("})", "application/json");
}

} // namespace

ForwarderConfig ForwarderConfig::from_settings(const config::UpstreamSettings& settings) {
    ForwarderConfig config;
    config.host = settings.host;
    config.port = settings.port;
    config.request_timeout = std::chrono::seconds(settings.timeout_seconds);
    return config;
}

Forwarder::Forwarder(const ForwarderConfig& config)
    : config_(config)
{
    PAGESTASH_LOG_DEBUG(Upstream, "Forwarding misses to {}:{} (timeout={}s)",
                        config_.host, config_.port, config_.request_timeout.count());
}

ForwardResult Forwarder::forward(const pipeline::Request& request) {
    ForwardResult result;
    auto start_time = std::chrono::steady_clock::now();

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::error_code ec;

        auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port));

        // Async operations driven to completion here so that the stream's
        // deadline applies to the whole exchange
        stream.expires_after(config_.request_timeout);
        stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        ioc.run();
        if (ec) {
            throw beast::system_error(ec);
        }

        auto upstream_request = build_upstream_request(request);
        ioc.restart();
        http::async_write(stream, upstream_request, [&ec](beast::error_code e, std::size_t) { ec = e; });
        ioc.run();
        if (ec) {
            throw beast::system_error(ec);
        }

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        // A HEAD answer announces a Content-Length it never sends
        parser.skip(request.message.method() == http::verb::head);
        ioc.restart();
        http::async_read(stream, buffer, parser,
                         [&ec](beast::error_code e, std::size_t) { ec = e; });
        ioc.run();
        if (ec) {
            throw beast::system_error(ec);
        }
        auto upstream_response = parser.release();

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            PAGESTASH_LOG_TRACE(Upstream, "Shutdown failed: {}", ec.message());
        }

        result.success = true;
        result.response = to_pipeline_response(std::move(upstream_response));

    } catch (const beast::system_error& e) {
        if (e.code() == beast::error::timeout) {
            result.error_message = "Upstream request timed out";
            result.response = error_response(http::status::gateway_timeout, result.error_message);
        } else {
            result.error_message = "Upstream communication error: " + e.code().message();
            result.response = error_response(http::status::bad_gateway, result.error_message);
        }
        PAGESTASH_LOG_WARN(Upstream, "{} {} to {}:{} failed: {}", request.method(),
                           request.full_path(), config_.host, config_.port, e.code().message());
    }

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    util::Metrics::instance().upstream_request(result.success, result.latency);

    PAGESTASH_LOG_DEBUG(Upstream, "{} {} -> {} in {}ms", request.method(), request.full_path(),
                        result.response.status_code(), result.latency.count());
    return result;
}

http::request<http::string_body> Forwarder::build_upstream_request(
    const pipeline::Request& request) const
{
    const auto& incoming = request.message;
    http::request<http::string_body> upstream{incoming.method(), incoming.target(), 11};

    const auto& hop_by_hop = hop_by_hop_fields();
    for (const auto& field : incoming) {
        if (hop_by_hop.count(field.name()) > 0 || field.name() == http::field::host) {
            continue;
        }
        upstream.insert(field.name_string(), field.value());
    }

    upstream.set(http::field::host, config_.host + ":" + std::to_string(config_.port));
    upstream.set(http::field::connection, "close");

    if (config_.add_forwarded_headers && !request.remote_addr.empty()) {
        std::string forwarded_for = request.remote_addr;
        if (auto it = incoming.find("X-Forwarded-For"); it != incoming.end()) {
            forwarded_for = to_std(it->value()) + ", " + request.remote_addr;
        }
        upstream.set("X-Forwarded-For", forwarded_for);

        if (incoming.find("X-Real-IP") == incoming.end()) {
            upstream.set("X-Real-IP", request.remote_addr);
        }
    }

    upstream.body() = incoming.body();
    upstream.prepare_payload();
    return upstream;
}

pipeline::Response Forwarder::to_pipeline_response(http::response<http::string_body> response) {
    const auto& hop_by_hop = hop_by_hop_fields();
    for (auto it = response.begin(); it != response.end();) {
        if (hop_by_hop.count(it->name()) > 0 || it->name() == http::field::server) {
            it = response.erase(it);
        } else {
            ++it;
        }
    }

    pipeline::Response result;
    result.message() = std::move(response);
    return result;
}

} // namespace pagestash::proxy
