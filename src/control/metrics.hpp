// Conduit Metrics - Header
// Lock-free gateway counters, reported through the health endpoint

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace conduit::control {

/// Point-in-time copy of the gateway counters
struct MetricsSnapshot {
    // Request metrics
    uint64_t total_requests = 0;
    uint64_t total_errors = 0;  // 5xx answers

    // Latency metrics (microseconds)
    uint64_t total_latency_us = 0;
    uint64_t min_latency_us = 0;
    uint64_t max_latency_us = 0;

    // HTTP status code counters
    uint64_t status_2xx = 0;
    uint64_t status_4xx = 0;
    uint64_t status_5xx = 0;

    // Engines
    uint64_t proxy_requests = 0;
    uint64_t composite_requests = 0;
    uint64_t composite_failures = 0;

    // Derived metrics
    [[nodiscard]] double error_rate() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_errors) / static_cast<double>(total_requests);
    }

    [[nodiscard]] double avg_latency_us() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_latency_us) / static_cast<double>(total_requests);
    }
};

/// Process-wide counters (shared by all request threads)
class GatewayMetrics {
public:
    GatewayMetrics() = default;
    ~GatewayMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;
    GatewayMetrics(GatewayMetrics&&) = delete;
    GatewayMetrics& operator=(GatewayMetrics&&) = delete;

    /// Record a finished request with its status and latency
    void record_request(int status_code, std::chrono::microseconds latency) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        record_status_code(status_code);
        record_latency(latency);
    }

    void record_proxy() noexcept { proxy_requests_.fetch_add(1, std::memory_order_relaxed); }

    void record_composite(bool success) noexcept {
        composite_requests_.fetch_add(1, std::memory_order_relaxed);
        if (!success) {
            composite_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /// Get current metrics snapshot
    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;
        snap.total_requests = total_requests_.load(std::memory_order_relaxed);
        snap.total_errors = status_5xx_.load(std::memory_order_relaxed);
        snap.total_latency_us = total_latency_us_.load(std::memory_order_relaxed);
        snap.min_latency_us = min_latency_us_.load(std::memory_order_relaxed);
        snap.max_latency_us = max_latency_us_.load(std::memory_order_relaxed);
        snap.status_2xx = status_2xx_.load(std::memory_order_relaxed);
        snap.status_4xx = status_4xx_.load(std::memory_order_relaxed);
        snap.status_5xx = status_5xx_.load(std::memory_order_relaxed);
        snap.proxy_requests = proxy_requests_.load(std::memory_order_relaxed);
        snap.composite_requests = composite_requests_.load(std::memory_order_relaxed);
        snap.composite_failures = composite_failures_.load(std::memory_order_relaxed);
        return snap;
    }

private:
    void record_status_code(int status_code) noexcept {
        if (status_code >= 200 && status_code < 300) {
            status_2xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 400 && status_code < 500) {
            status_4xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 500) {
            status_5xx_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void record_latency(std::chrono::microseconds latency) noexcept {
        auto latency_us = static_cast<uint64_t>(latency.count());

        total_latency_us_.fetch_add(latency_us, std::memory_order_relaxed);

        // Update min (if this is smaller)
        uint64_t current_min = min_latency_us_.load(std::memory_order_relaxed);
        while (latency_us < current_min || current_min == 0) {
            if (min_latency_us_.compare_exchange_weak(current_min, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }

        // Update max (if this is larger)
        uint64_t current_max = max_latency_us_.load(std::memory_order_relaxed);
        while (latency_us > current_max) {
            if (max_latency_us_.compare_exchange_weak(current_max, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }
    }

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_latency_us_{0};
    std::atomic<uint64_t> min_latency_us_{0};
    std::atomic<uint64_t> max_latency_us_{0};
    std::atomic<uint64_t> status_2xx_{0};
    std::atomic<uint64_t> status_4xx_{0};
    std::atomic<uint64_t> status_5xx_{0};
    std::atomic<uint64_t> proxy_requests_{0};
    std::atomic<uint64_t> composite_requests_{0};
    std::atomic<uint64_t> composite_failures_{0};
};

} // namespace conduit::control
