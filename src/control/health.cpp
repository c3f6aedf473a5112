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

// Conduit Health Checks - Implementation

#include "health.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace conduit::control {

std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

HealthChecker::HealthChecker(std::string version) : version_(std::move(version)) {}

void HealthChecker::start() {
    start_time_ = std::chrono::system_clock::now();
}

void HealthChecker::add_probe(Probe probe) {
    std::lock_guard lock(probes_mutex_);
    probes_.push_back(std::move(probe));
}

ServerHealth HealthChecker::get_server_health(const MetricsSnapshot& metrics) const {
    ServerHealth health;

    auto now = std::chrono::system_clock::now();
    health.uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
    health.start_time = start_time_;
    health.version = version_;
    health.metrics = metrics;

    // Determine overall status from the error rate
    double error_rate = metrics.error_rate();
    if (error_rate >= 0.5) {
        health.status = HealthStatus::Unhealthy;
    } else if (error_rate >= 0.1) {
        health.status = HealthStatus::Degraded;
    }

    std::vector<Probe> probes;
    {
        std::lock_guard lock(probes_mutex_);
        probes = probes_;
    }

    // Worst component wins
    for (const auto& probe : probes) {
        auto component = probe();
        if (static_cast<int>(component.status) > static_cast<int>(health.status)) {
            health.status = component.status;
        }
        health.components.push_back(std::move(component));
    }

    return health;
}

std::string HealthResponse::to_json(const ServerHealth& health) {
    nlohmann::ordered_json j;
    j["status"] = std::string(to_string(health.status));
    j["uptime_seconds"] = health.uptime.count();
    if (!health.version.empty()) {
        j["version"] = health.version;
    }

    const auto& m = health.metrics;
    j["metrics"] = {
        {"total_requests", m.total_requests},
        {"total_errors", m.total_errors},
        {"error_rate", m.error_rate()},
        {"avg_latency_us", m.avg_latency_us()},
        {"max_latency_us", m.max_latency_us},
        {"status_2xx", m.status_2xx},
        {"status_4xx", m.status_4xx},
        {"status_5xx", m.status_5xx},
        {"proxy_requests", m.proxy_requests},
        {"composite_requests", m.composite_requests},
        {"composite_failures", m.composite_failures},
    };

    nlohmann::ordered_json components = nlohmann::ordered_json::array();
    for (const auto& c : health.components) {
        nlohmann::ordered_json entry;
        entry["name"] = c.name;
        entry["status"] = std::string(to_string(c.status));
        if (!c.detail.empty()) {
            entry["detail"] = c.detail;
        }
        components.push_back(std::move(entry));
    }
    j["components"] = std::move(components);

    return j.dump();
}

std::string HealthResponse::to_text(const ServerHealth& health) {
    std::ostringstream oss;
    oss << to_string(health.status) << "\n";
    oss << "uptime: " << health.uptime.count() << "s\n";
    oss << "requests: " << health.metrics.total_requests << "\n";
    oss << "errors: " << health.metrics.total_errors << "\n";
    for (const auto& c : health.components) {
        oss << c.name << ": " << to_string(c.status);
        if (!c.detail.empty()) {
            oss << " (" << c.detail << ")";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace conduit::control
