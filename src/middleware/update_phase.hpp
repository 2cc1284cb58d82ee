/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Update Phase - Post-handler cacheability decision and store
 *
 * Runs after the handler for requests the fetch phase marked as storable.
 * Resolves the TTL, patches freshness headers, learns the header list from
 * the response's Vary header and stores the response under the page key
 * derived from it.
 */

#ifndef PAGESTASH_MIDDLEWARE_UPDATE_PHASE_HPP
#define PAGESTASH_MIDDLEWARE_UPDATE_PHASE_HPP

#include "cache/cache_backend.hpp"
#include "cache/registry.hpp"
#include "middleware/cache_options.hpp"
#include "pipeline/request.hpp"
#include "pipeline/response.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace pagestash::middleware {

class UpdatePhase {
public:
    /**
     * @throws config::ConfigError if anonymous_only is set while no
     *         authentication subsystem is available
     */
    UpdatePhase(CacheOptions options, std::shared_ptr<cache::CacheBackend> backend);

    /**
     * Installed on its own: deployment options and the deployment alias
     * @throws config::ConfigError
     */
    UpdatePhase(const config::Config& config, const cache::CacheRegistry& registry);

    /**
     * Store `response` if it is cacheable for `request`
     *
     * @return `response`, possibly with freshness headers added. Backend
     *         write failures are logged and never reach the caller.
     */
    pipeline::Response& maybe_store(pipeline::Request& request, pipeline::Response& response);

    const CacheOptions& options() const { return options_; }

private:
    bool skip_for_identity(const pipeline::Request& request) const;

    CacheOptions options_;
    std::shared_ptr<cache::CacheBackend> backend_;
};

} // namespace pagestash::middleware

#endif // PAGESTASH_MIDDLEWARE_UPDATE_PHASE_HPP
