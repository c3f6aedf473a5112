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

// Configuration Validator - Name security and typo detection

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace conduit::control {

// Limits applied to names that end up in file paths, cache keys and URLs
constexpr size_t MAX_NAME_LENGTH = 128;
constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;
constexpr size_t MAX_FUZZY_MATCH_CANDIDATES = 3;

/// Security and cross-reference validation on top of ConfigLoader::validate
class ConfigValidator {
public:
    /// Validate environment names and per-endpoint cache duration keys
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Warn about cache.endpoint_durations keys naming unknown endpoints
    [[nodiscard]] static ValidationResult validate_against_endpoints(
        const Config& config, const std::vector<std::string>& endpoint_names);

    /// Returns empty string if `name` is safe as an environment/endpoint name, otherwise the reason
    [[nodiscard]] static std::string validate_name_security(std::string_view name);

    /// Closest candidates for a probable typo ("" when none), comma separated
    [[nodiscard]] static std::string suggest_similar(const std::string& typo,
                                                     const std::vector<std::string>& candidates);
};

}  // namespace conduit::control
