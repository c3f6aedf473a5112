/*
 * Copyright 2025 Conduit Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conduit Health Checks - Header
// Liveness and readiness reporting for /health/live and /health

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"

namespace conduit::control {

/// Health status levels
enum class HealthStatus {
    Healthy,    // All systems operational
    Degraded,   // Some issues but still serving traffic
    Unhealthy   // Critical issues, should not receive traffic
};

[[nodiscard]] std::string_view to_string(HealthStatus status) noexcept;

/// One dependency (endpoint directory, cache backend, ...)
struct ComponentHealth {
    std::string name;
    HealthStatus status = HealthStatus::Healthy;
    std::string detail;
};

/// Server health information
struct ServerHealth {
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::seconds uptime{0};
    std::chrono::system_clock::time_point start_time;
    std::string version;
    MetricsSnapshot metrics;
    std::vector<ComponentHealth> components;
};

/// Aggregates component probes and request metrics into one status
class HealthChecker {
public:
    using Probe = std::function<ComponentHealth()>;

    explicit HealthChecker(std::string version = "");
    ~HealthChecker() = default;

    // Non-copyable, non-movable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Reset the uptime clock
    void start();

    /// Register a component probe (run on every readiness check)
    void add_probe(Probe probe);

    /// Run probes and combine with the request error rate
    [[nodiscard]] ServerHealth get_server_health(const MetricsSnapshot& metrics) const;

private:
    std::string version_;
    std::chrono::system_clock::time_point start_time_ = std::chrono::system_clock::now();

    mutable std::mutex probes_mutex_;
    std::vector<Probe> probes_;
};

/// Health check response builder
class HealthResponse {
public:
    /// Build JSON health response
    [[nodiscard]] static std::string to_json(const ServerHealth& health);

    /// Build simple text response (for basic health checks)
    [[nodiscard]] static std::string to_text(const ServerHealth& health);

    /// Determine HTTP status code based on health
    [[nodiscard]] static uint16_t to_http_status(HealthStatus status) noexcept {
        switch (status) {
            case HealthStatus::Healthy:
                return 200;  // OK
            case HealthStatus::Degraded:
                return 200;  // Still OK but with warnings
            case HealthStatus::Unhealthy:
                return 503;  // Service Unavailable
        }
        return 500;  // Internal Server Error
    }
};

} // namespace conduit::control
