/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Update Phase Implementation
 */

#include "middleware/update_phase.hpp"
#include "cache/cache_headers.hpp"
#include "cache/snapshot.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

namespace pagestash::middleware {

using util::log_component::Update;

namespace {

bool write(cache::CacheBackend& backend, const std::string& key, std::string value,
           std::chrono::seconds ttl) {
    try {
        backend.set(key, std::move(value), ttl);
        return true;
    } catch (const cache::CacheBackendError& e) {
        PAGESTASH_LOG_WARN(Update, "Cache write failed for {}: {}", key, e.what());
        util::Metrics::instance().backend_write_error();
        return false;
    } catch (const std::exception& e) {
        PAGESTASH_LOG_ERROR(Update, "Unexpected error writing {}: {}", key, e.what());
        util::Metrics::instance().backend_write_error();
        return false;
    }
}

void store_page(cache::CacheBackend& backend, const std::string& key,
                const pipeline::Response& response, std::chrono::seconds ttl) {
    if (write(backend, key, cache::encode_response(response), ttl)) {
        util::Metrics::instance().cache_store();
    }
}

} // namespace

UpdatePhase::UpdatePhase(CacheOptions options, std::shared_ptr<cache::CacheBackend> backend)
    : options_(std::move(options))
    , backend_(std::move(backend))
{
    if (options_.anonymous_only && !options_.identity_available) {
        throw config::ConfigError(
            "anonymous_only caching requires the authentication subsystem (auth.enabled)");
    }
}

UpdatePhase::UpdatePhase(const config::Config& config, const cache::CacheRegistry& registry)
    : UpdatePhase(options_from_config(config), registry.get(config.cache_middleware.alias))
{
}

bool UpdatePhase::skip_for_identity(const pipeline::Request& request) const {
    if (!options_.anonymous_only || !request.session_accessed()) {
        return false;
    }
    if (!request.user) {
        PAGESTASH_LOG_ERROR(Update, "Session accessed for {} but no identity is attached; "
                            "not caching", request.full_path());
        return true;
    }
    return request.user->is_authenticated();
}

pipeline::Response& UpdatePhase::maybe_store(pipeline::Request& request,
                                             pipeline::Response& response) {
    if (!request.should_store.value_or(false)) {
        return response;
    }

    auto& metrics = util::Metrics::instance();

    if (skip_for_identity(request)) {
        PAGESTASH_LOG_DEBUG(Update, "Not caching {}: authenticated session", request.full_path());
        metrics.cache_store_skipped();
        return response;
    }

    if (response.status_code() != 200) {
        metrics.cache_store_skipped();
        return response;
    }

    auto timeout = options_.cache_timeout;
    if (auto max_age = cache::get_max_age(response)) {
        if (max_age->count() == 0) {
            metrics.cache_store_skipped();
            return response;
        }
        timeout = *max_age;
    }

    cache::patch_response_headers(response, timeout, options_.use_etags);

    if (timeout.count() <= 0) {
        metrics.cache_store_skipped();
        return response;
    }

    auto header_list = cache::vary_header_list(response);
    // A page is only reachable through its header list
    if (!write(*backend_,
               cache::header_list_key(options_.key_prefix, request, options_.key_context),
               cache::encode_header_list(header_list),
               timeout)) {
        return response;
    }

    auto key = cache::page_key(request, request.method(), header_list,
                               options_.key_prefix, options_.key_context);
    PAGESTASH_LOG_DEBUG(Update, "Storing {} {} for {}s", request.method(), request.full_path(),
                        timeout.count());

    if (response.is_deferred()) {
        response.add_post_render_callback(
            [backend = backend_, key, timeout](pipeline::Response& rendered) {
                store_page(*backend, key, rendered, timeout);
            });
    } else {
        store_page(*backend_, key, response, timeout);
    }

    return response;
}

} // namespace pagestash::middleware
