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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <cctype>
#include <sstream>

#include "../core/string_utils.hpp"

namespace conduit::control {

std::string ConfigValidator::validate_name_security(std::string_view name) {
    if (name.empty()) {
        return "Name cannot be empty";
    }
    if (name.length() > MAX_NAME_LENGTH) {
        std::ostringstream msg;
        msg << "Name too long (" << name.length() << " > " << MAX_NAME_LENGTH << " chars)";
        return msg.str();
    }

    // Path traversal prevention (names become directory components)
    if (name.find("..") != std::string_view::npos) {
        return "Path traversal detected (..)";
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        return "Path separators not allowed";
    }

    // Names are embedded in cache keys (':' separated) and URL paths
    for (size_t i = 0; i < name.length(); ++i) {
        char c = name[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            std::ostringstream msg;
            msg << "Invalid character '";
            if (std::isprint(static_cast<unsigned char>(c))) {
                msg << c;
            } else {
                msg << "\\x" << std::hex << static_cast<int>(static_cast<unsigned char>(c));
            }
            msg << "' at position " << std::dec << i
                << " (only alphanumeric, underscore, hyphen and dot allowed)";
            return msg.str();
        }
    }

    return "";
}

std::string ConfigValidator::suggest_similar(const std::string& typo,
                                             const std::vector<std::string>& candidates) {
    // Bound fuzzy matching cost on hostile input
    if (typo.length() > MAX_NAME_LENGTH) {
        return "";
    }

    std::vector<std::string> similar =
        core::find_similar_strings(typo, candidates, MAX_LEVENSHTEIN_DISTANCE);

    if (similar.size() > MAX_FUZZY_MATCH_CANDIDATES) {
        similar.resize(MAX_FUZZY_MATCH_CANDIDATES);
    }

    return core::join(similar, ", ");
}

ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;

    for (const auto& env : config.environments.allowed) {
        if (auto error = validate_name_security(env); !error.empty()) {
            result.add_error("Invalid environment name '" + env + "': " + error);
        }
    }

    for (const auto& [endpoint, seconds] : config.cache.endpoint_durations) {
        if (auto error = validate_name_security(endpoint); !error.empty()) {
            result.add_error("Invalid cache.endpoint_durations key '" + endpoint + "': " + error);
        }
        if (seconds == 0) {
            result.add_warning("cache.endpoint_durations['" + endpoint +
                               "'] is 0: responses for this endpoint are never cached");
        }
    }

    return result;
}

ValidationResult ConfigValidator::validate_against_endpoints(
    const Config& config, const std::vector<std::string>& endpoint_names) {
    ValidationResult result;

    for (const auto& [endpoint, _] : config.cache.endpoint_durations) {
        bool known = false;
        for (const auto& name : endpoint_names) {
            if (core::iequals(name, endpoint)) {
                known = true;
                break;
            }
        }
        if (known) {
            continue;
        }

        std::string msg = "cache.endpoint_durations references unknown endpoint '" + endpoint + "'";
        if (auto suggestion = suggest_similar(endpoint, endpoint_names); !suggestion.empty()) {
            msg += ". Did you mean: " + suggestion;
        }
        result.add_warning(std::move(msg));
    }

    return result;
}

}  // namespace conduit::control
