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

// Conduit Environment Registry - Header
// Environment allow-list and per-environment settings (environments/<env>/settings.json)

#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace conduit::gateway {

/// Settings for one environment
struct EnvironmentSettings {
    std::string name;
    std::string server_name;
    http::HeaderMap headers;  // Added to every proxied request for this environment
};

class EnvironmentRegistry {
public:
    explicit EnvironmentRegistry(control::EnvironmentsConfig config);

    // Non-copyable (owns mutex)
    EnvironmentRegistry(const EnvironmentRegistry&) = delete;
    EnvironmentRegistry& operator=(const EnvironmentRegistry&) = delete;

    /// Re-read settings files. Unreadable files are reported and skipped.
    control::ValidationResult reload();

    /// Global allow-list check (empty list allows every environment)
    [[nodiscard]] bool is_allowed(std::string_view environment) const;

    [[nodiscard]] std::optional<EnvironmentSettings> settings_for(std::string_view environment) const;

    /// Extra headers for the environment, empty when it has no settings file
    [[nodiscard]] http::HeaderMap headers_for(std::string_view environment) const;

    [[nodiscard]] std::vector<std::string> allowed() const;

private:
    control::EnvironmentsConfig config_;
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, EnvironmentSettings> settings_;  // Keyed by lower-cased name
};

}  // namespace conduit::gateway
