/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Fetch Phase Implementation
 */

#include "middleware/fetch_phase.hpp"
#include "cache/snapshot.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

namespace pagestash::middleware {

namespace http = boost::beast::http;

using util::log_component::Fetch;

FetchPhase::FetchPhase(CacheOptions options, std::shared_ptr<cache::CacheBackend> backend)
    : options_(std::move(options))
    , backend_(std::move(backend))
{
}

FetchPhase::FetchPhase(const config::Config& config, const cache::CacheRegistry& registry)
    : FetchPhase(options_from_config(config), registry.get(config.cache_middleware.alias))
{
}

std::optional<pipeline::Response> FetchPhase::lookup(pipeline::Request& request) {
    auto method = request.message.method();
    if (method != http::verb::get && method != http::verb::head) {
        request.should_store = false;
        return std::nullopt;
    }

    auto& metrics = util::Metrics::instance();
    metrics.cache_lookup();

    auto header_list_data = read(cache::header_list_key(options_.key_prefix, request,
                                                        options_.key_context));
    std::optional<cache::HeaderList> header_list;
    if (header_list_data) {
        header_list = cache::decode_header_list(*header_list_data);
        if (!header_list) {
            PAGESTASH_LOG_WARN(Fetch, "Discarding undecodable header list for {}",
                               request.full_path());
        }
    }
    if (!header_list) {
        PAGESTASH_LOG_DEBUG(Fetch, "No header list for {}, response will be generated",
                            request.full_path());
        request.should_store = true;
        metrics.cache_miss();
        return std::nullopt;
    }

    std::optional<std::string> page_data;
    bool is_head = method == http::verb::head;
    if (!is_head || options_.head_uses_get_entries) {
        page_data = read(cache::page_key(request, "GET", *header_list,
                                         options_.key_prefix, options_.key_context));
    }
    if (!page_data && is_head) {
        page_data = read(cache::page_key(request, "HEAD", *header_list,
                                         options_.key_prefix, options_.key_context));
    }

    std::optional<pipeline::Response> response;
    if (page_data) {
        response = cache::decode_response(*page_data);
        if (!response) {
            PAGESTASH_LOG_WARN(Fetch, "Discarding undecodable page for {}", request.full_path());
        }
    }
    if (!response) {
        PAGESTASH_LOG_DEBUG(Fetch, "Page miss for {} {}", request.method(), request.full_path());
        request.should_store = true;
        metrics.cache_miss();
        return std::nullopt;
    }

    PAGESTASH_LOG_DEBUG(Fetch, "Page hit for {} {}", request.method(), request.full_path());
    request.should_store = false;
    request.served_from_cache = true;
    metrics.cache_hit();
    return response;
}

std::optional<std::string> FetchPhase::read(const std::string& key) {
    try {
        return backend_->get(key);
    } catch (const cache::CacheBackendError& e) {
        PAGESTASH_LOG_WARN(Fetch, "Cache read failed for {}: {}", key, e.what());
        util::Metrics::instance().backend_read_error();
        return std::nullopt;
    } catch (const std::exception& e) {
        PAGESTASH_LOG_ERROR(Fetch, "Unexpected error reading {}: {}", key, e.what());
        util::Metrics::instance().backend_read_error();
        return std::nullopt;
    }
}

} // namespace pagestash::middleware
