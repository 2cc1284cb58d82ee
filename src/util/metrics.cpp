/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Metrics Implementation
 */

#include "util/metrics.hpp"

namespace pagestash::util {

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
{
}

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::request_started() {
    requests_total_.fetch_add(1, std::memory_order_relaxed);
    requests_active_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::request_completed(bool success) {
    requests_active_.fetch_sub(1, std::memory_order_relaxed);
    if (success) {
        requests_success_.fetch_add(1, std::memory_order_relaxed);
    } else {
        requests_error_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Metrics::cache_lookup() {
    cache_lookups_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_store() {
    cache_stores_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_store_skipped() {
    cache_store_skipped_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::backend_read_error() {
    backend_read_errors_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::backend_write_error() {
    backend_write_errors_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::upstream_request(bool success, std::chrono::milliseconds latency) {
    upstream_requests_.fetch_add(1, std::memory_order_relaxed);
    if (!success) {
        upstream_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    upstream_latency_sum_ms_.fetch_add(static_cast<std::uint64_t>(latency.count()),
                                       std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.requests_total = requests_total_.load(std::memory_order_relaxed);
    snap.requests_active = requests_active_.load(std::memory_order_relaxed);
    snap.requests_success = requests_success_.load(std::memory_order_relaxed);
    snap.requests_error = requests_error_.load(std::memory_order_relaxed);

    snap.cache_lookups = cache_lookups_.load(std::memory_order_relaxed);
    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    snap.cache_stores = cache_stores_.load(std::memory_order_relaxed);
    snap.cache_store_skipped = cache_store_skipped_.load(std::memory_order_relaxed);
    snap.backend_read_errors = backend_read_errors_.load(std::memory_order_relaxed);
    snap.backend_write_errors = backend_write_errors_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / cache_total
        : 0.0;

    snap.upstream_requests = upstream_requests_.load(std::memory_order_relaxed);
    snap.upstream_errors = upstream_errors_.load(std::memory_order_relaxed);
    snap.upstream_latency_avg_ms = snap.upstream_requests > 0
        ? static_cast<double>(upstream_latency_sum_ms_.load(std::memory_order_relaxed)) /
              snap.upstream_requests
        : 0.0;

    snap.uptime_seconds = uptime_seconds();

    return snap;
}

nlohmann::json MetricsSnapshot::to_json() const {
    return {
        {"requests", {
            {"total", requests_total},
            {"active", requests_active},
            {"success", requests_success},
            {"error", requests_error}
        }},
        {"cache", {
            {"lookups", cache_lookups},
            {"hits", cache_hits},
            {"misses", cache_misses},
            {"hit_rate", cache_hit_rate},
            {"stores", cache_stores},
            {"store_skipped", cache_store_skipped},
            {"backend_read_errors", backend_read_errors},
            {"backend_write_errors", backend_write_errors}
        }},
        {"upstream", {
            {"requests", upstream_requests},
            {"errors", upstream_errors},
            {"latency_avg_ms", upstream_latency_avg_ms}
        }},
        {"uptime_seconds", uptime_seconds}
    };
}

} // namespace pagestash::util
