/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Metrics - Thread-safe statistics collection for monitoring
 *
 * Provides:
 * - Request counters (total, active, errors)
 * - Cache lookup/hit/miss/store statistics
 * - Cache backend read/write failures
 * - Upstream origin metrics (requests, errors, latency)
 */

#ifndef PAGESTASH_UTIL_METRICS_HPP
#define PAGESTASH_UTIL_METRICS_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace pagestash::util {

/**
 * Global metrics snapshot
 */
struct MetricsSnapshot {
    // Request metrics
    std::uint64_t requests_total{0};
    std::uint64_t requests_active{0};
    std::uint64_t requests_success{0};
    std::uint64_t requests_error{0};

    // Cache metrics
    std::uint64_t cache_lookups{0};
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    std::uint64_t cache_stores{0};
    std::uint64_t cache_store_skipped{0};
    std::uint64_t backend_read_errors{0};
    std::uint64_t backend_write_errors{0};
    double cache_hit_rate{0.0};

    // Upstream metrics
    std::uint64_t upstream_requests{0};
    std::uint64_t upstream_errors{0};
    double upstream_latency_avg_ms{0.0};

    std::uint64_t uptime_seconds{0};

    nlohmann::json to_json() const;
};

/**
 * Metrics collector - centralized statistics tracking
 *
 * Lock-free atomic counters behind a process-wide instance.
 */
class Metrics {
public:
    static Metrics& instance();

    // Request tracking
    void request_started();
    void request_completed(bool success);

    // Cache tracking
    void cache_lookup();
    void cache_hit();
    void cache_miss();
    void cache_store();
    void cache_store_skipped();
    void backend_read_error();
    void backend_write_error();

    // Upstream tracking
    void upstream_request(bool success, std::chrono::milliseconds latency);

    MetricsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    Metrics();
    ~Metrics() = default;

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> requests_active_{0};
    std::atomic<std::uint64_t> requests_success_{0};
    std::atomic<std::uint64_t> requests_error_{0};

    std::atomic<std::uint64_t> cache_lookups_{0};
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> cache_stores_{0};
    std::atomic<std::uint64_t> cache_store_skipped_{0};
    std::atomic<std::uint64_t> backend_read_errors_{0};
    std::atomic<std::uint64_t> backend_write_errors_{0};

    std::atomic<std::uint64_t> upstream_requests_{0};
    std::atomic<std::uint64_t> upstream_errors_{0};
    std::atomic<std::uint64_t> upstream_latency_sum_ms_{0};

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace pagestash::util

#endif // PAGESTASH_UTIL_METRICS_HPP
