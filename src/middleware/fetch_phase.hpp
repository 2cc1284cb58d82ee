/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Fetch Phase - Pre-handler cache lookup
 *
 * Looks up the header list learned for the request's path, derives the page
 * key from it and serves the stored response on a hit. Records on the request
 * whether the update phase should store the generated response.
 */

#ifndef PAGESTASH_MIDDLEWARE_FETCH_PHASE_HPP
#define PAGESTASH_MIDDLEWARE_FETCH_PHASE_HPP

#include "cache/cache_backend.hpp"
#include "cache/registry.hpp"
#include "middleware/cache_options.hpp"
#include "pipeline/request.hpp"
#include "pipeline/response.hpp"

#include <memory>
#include <optional>
#include <string>

namespace pagestash::middleware {

class FetchPhase {
public:
    FetchPhase(CacheOptions options, std::shared_ptr<cache::CacheBackend> backend);

    /**
     * Installed on its own: deployment options and the deployment alias
     * @throws config::ConfigError if the alias is not configured
     */
    FetchPhase(const config::Config& config, const cache::CacheRegistry& registry);

    /**
     * @return Independent copy of the cached response, or nullopt on a miss.
     *         Never invokes the handler; backend failures count as misses.
     */
    std::optional<pipeline::Response> lookup(pipeline::Request& request);

    const CacheOptions& options() const { return options_; }

private:
    std::optional<std::string> read(const std::string& key);

    CacheOptions options_;
    std::shared_ptr<cache::CacheBackend> backend_;
};

} // namespace pagestash::middleware

#endif // PAGESTASH_MIDDLEWARE_FETCH_PHASE_HPP
