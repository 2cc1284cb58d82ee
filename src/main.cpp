/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 *
 * HTTP front end that serves pages from the cache and forwards misses to a
 * single upstream origin.
 */

#include "cache/lru_cache.hpp"
#include "cache/registry.hpp"
#include "config/config.hpp"
#include "middleware/combined_cache.hpp"
#include "proxy/forwarder.hpp"
#include "server/auth.hpp"
#include "server/connection.hpp"
#include "server/server.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>

namespace asio = boost::asio;
namespace http = boost::beast::http;

using namespace pagestash;

namespace {

std::string stats_json(const cache::CacheRegistry& registry) {
    auto metrics = util::Metrics::instance().snapshot().to_json();

    auto backends = nlohmann::json::object();
    for (const auto& alias : registry.aliases()) {
        auto lru = std::dynamic_pointer_cast<cache::LruCache>(registry.storage(alias));
        if (!lru) {
            backends[alias] = {{"backend", "dummy"}};
            continue;
        }
        auto stats = lru->get_stats();
        backends[alias] = {
            {"backend", "locmem"},
            {"hits", stats.hits},
            {"misses", stats.misses},
            {"hit_rate", stats.hit_rate()},
            {"evictions", stats.evictions},
            {"expired", stats.expired},
            {"entries", stats.entries},
            {"size_bytes", stats.size_bytes},
            {"max_size_bytes", stats.max_size_bytes}
        };
    }

    metrics["backends"] = std::move(backends);
    return metrics.dump(2);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            return 0;
        }
        auto config = config_manager.get_config();

        util::Logger::init(util::LogConfig::from_settings(config.logging));
        PAGESTASH_LOG_INFO(util::log_component::Server, "PAGESTASH page cache v0.1.0");
        if (!config_manager.get_config_path().empty()) {
            PAGESTASH_LOG_INFO(util::log_component::Config, "Loaded configuration from {}",
                               config_manager.get_config_path().string());
        }

        auto server_config = server::ServerConfig::from_settings(config.server);
        PAGESTASH_LOG_INFO(util::log_component::Config, "port={}, threads={}, bind={}, upstream={}:{}",
                           server_config.port, server_config.thread_count, server_config.bind_address,
                           config.upstream.host, config.upstream.port);

        auto registry = std::make_shared<cache::CacheRegistry>(config.caches);
        auto page_cache = std::make_shared<middleware::CombinedCache>(config, *registry);
        auto forwarder = std::make_shared<proxy::Forwarder>(
            proxy::ForwarderConfig::from_settings(config.upstream));

        auto request_handler = [config, registry, page_cache, forwarder](pipeline::Request& request) {
            const auto& target = request.message.target();
            bool is_get = request.message.method() == http::verb::get;

            if (is_get && target == "/health") {
                return pipeline::Response(http::status::ok, R"({"status": "healthy"})",
                                          "application/json");
            }
            if (is_get && target == "/cache/stats") {
                return pipeline::Response(http::status::ok, stats_json(*registry), "application/json");
            }

            server::attach_auth(request, config.auth);

            auto response = page_cache->handle(request, [&forwarder](pipeline::Request& r) {
                return (*forwarder)(r);
            });
            response.set_header("X-Cache", request.cache_status());
            return response;
        };

        server::Server http_server(server_config);
        http_server.start([request_handler](asio::ip::tcp::socket socket) {
            server::handle_connection(std::move(socket), request_handler);
        });

        PAGESTASH_LOG_INFO(util::log_component::Server, "Press Ctrl+C to stop");
        http_server.wait();

        PAGESTASH_LOG_INFO(util::log_component::Server, "Server stopped gracefully");
        util::Logger::instance().shutdown();
        return 0;

    } catch (const config::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        PAGESTASH_LOG_CRITICAL(util::log_component::Server, "Fatal error: {}", e.what());
        util::Logger::instance().shutdown();
        return 1;
    }
}
