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

// Conduit Endpoint Directory - Header
// Endpoint definitions loaded from the endpoints directory, swapped atomically on reload

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace conduit::gateway {

enum class EndpointType : uint8_t { Standard, Composite, Sql, Webhook, Files };

[[nodiscard]] std::string_view to_string(EndpointType type) noexcept;

/// One step of a composite workflow
struct CompositeStep {
    std::string name;
    std::string endpoint;                       // Target endpoint name
    http::Method method = http::Method::POST;
    std::optional<std::string> depends_on;      // At most one predecessor
    bool is_array = false;
    std::optional<std::string> array_property;  // Dotted path to the array in the input
    std::optional<std::string> source_property; // Dotted path to the input document

    // field -> template expression, in declaration order
    std::vector<std::pair<std::string, std::string>> template_transformations;
};

struct CompositeDefinition {
    std::string name;
    std::string description;
    std::vector<CompositeStep> steps;
};

/// Immutable once published in a directory snapshot
struct EndpointDefinition {
    std::string name;
    std::string url;                               // Backend base URL
    std::vector<http::Method> methods;
    bool is_private = false;
    std::vector<std::string> allowed_environments; // Empty = all
    EndpointType type = EndpointType::Standard;
    std::optional<CompositeDefinition> composite;
    std::optional<uint32_t> cache_duration_seconds;

    [[nodiscard]] bool allows_method(http::Method method) const noexcept;
    [[nodiscard]] bool allows_environment(std::string_view environment) const noexcept;
};

/// Parse an entity.json document. nullopt with `error` when it is not a usable definition.
[[nodiscard]] std::optional<EndpointDefinition> parse_endpoint_definition(
    const nlohmann::ordered_json& entity, std::string_view name, EndpointType default_type,
    std::string& error);

/// Structural checks on a workflow: unique step names, known non-self predecessors,
/// a single predecessor per step, no cycles
[[nodiscard]] control::ValidationResult validate_composite(const CompositeDefinition& composite);

/// Loaded endpoints, keyed by lower-cased name
struct DirectorySnapshot {
    core::fast_map<std::string, std::shared_ptr<const EndpointDefinition>> endpoints;
    std::vector<std::string> names;  // Original spelling, load order
};

/// Endpoint lookup with explicit reload
/// Readers take a snapshot reference; reload() publishes a new snapshot without
/// disturbing requests that still hold the old one.
class EndpointDirectory {
public:
    /// Empty directory; call reload() or replace() to populate
    explicit EndpointDirectory(std::string directory = {});

    // Non-copyable
    EndpointDirectory(const EndpointDirectory&) = delete;
    EndpointDirectory& operator=(const EndpointDirectory&) = delete;

    /// Re-read `{directory}/Proxy`, `Composite`, `SQL`, `Webhooks` and `Files`.
    /// Invalid definitions are skipped and reported as errors; the rest are published.
    control::ValidationResult reload();

    /// Publish definitions built in memory (same validation as reload)
    control::ValidationResult replace(std::vector<EndpointDefinition> definitions);

    /// Case-insensitive lookup; nullptr when unknown
    [[nodiscard]] std::shared_ptr<const EndpointDefinition> lookup(std::string_view name) const;

    /// Closest known names for an unknown one ("" when none)
    [[nodiscard]] std::string suggest(std::string_view name) const;

    [[nodiscard]] std::shared_ptr<const DirectorySnapshot> snapshot() const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }

private:
    std::string directory_;
    std::mutex reload_mutex_;  // Serializes writers only
    std::shared_ptr<const DirectorySnapshot> snapshot_;
};

}  // namespace conduit::gateway
