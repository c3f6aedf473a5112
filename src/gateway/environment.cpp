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

// Conduit Environment Registry - Implementation

#include "environment.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../control/config_validator.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

namespace fs = std::filesystem;

EnvironmentRegistry::EnvironmentRegistry(control::EnvironmentsConfig config)
    : config_(std::move(config)) {}

control::ValidationResult EnvironmentRegistry::reload() {
    control::ValidationResult result;
    core::fast_map<std::string, EnvironmentSettings> loaded;

    std::error_code ec;
    if (!fs::is_directory(config_.directory, ec)) {
        result.add_warning("Environments directory not found: " + config_.directory);
    } else {
        for (const auto& item : fs::directory_iterator(config_.directory, ec)) {
            if (!item.is_directory(ec)) {
                continue;
            }
            std::string name = item.path().filename().string();
            if (!control::ConfigValidator::validate_name_security(name).empty()) {
                result.add_warning("Skipping environment with unsafe name: " + name);
                continue;
            }

            fs::path file = item.path() / "settings.json";
            std::ifstream in{file};
            if (!in.is_open()) {
                result.add_warning("No settings.json for environment " + name);
                continue;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();

            try {
                auto j = nlohmann::json::parse(buffer.str());
                EnvironmentSettings settings;
                settings.name = name;
                settings.server_name = j.value("ServerName", "");
                if (j.contains("Headers") && j.at("Headers").is_object()) {
                    for (const auto& [header, value] : j.at("Headers").items()) {
                        if (value.is_string()) {
                            settings.headers[header] = value.get<std::string>();
                        }
                    }
                }
                loaded.emplace(core::to_lower(name), std::move(settings));
            } catch (const nlohmann::json::exception& e) {
                result.add_error("Invalid settings.json for environment " + name + ": " + e.what());
            }
        }
    }

    for (const auto& env : config_.allowed) {
        if (!loaded.contains(core::to_lower(env))) {
            result.add_warning("Allowed environment '" + env + "' has no settings file");
        }
    }

    auto* logger = logging::get_logger();
    for (const auto& e : result.errors) {
        LOG_ERROR(logger, "Environment settings error: {}", e);
    }
    for (const auto& w : result.warnings) {
        LOG_WARNING(logger, "Environment settings warning: {}", w);
    }

    size_t count = loaded.size();
    {
        std::unique_lock lock(mutex_);
        settings_ = std::move(loaded);
    }
    LOG_INFO(logger, "Loaded settings for {} environments", count);
    return result;
}

bool EnvironmentRegistry::is_allowed(std::string_view environment) const {
    if (environment.empty()) {
        return false;
    }
    if (config_.allowed.empty()) {
        return true;
    }
    for (const auto& env : config_.allowed) {
        if (core::iequals(env, environment)) {
            return true;
        }
    }
    return false;
}

std::optional<EnvironmentSettings> EnvironmentRegistry::settings_for(std::string_view environment) const {
    std::shared_lock lock(mutex_);
    auto it = settings_.find(core::to_lower(environment));
    if (it == settings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

http::HeaderMap EnvironmentRegistry::headers_for(std::string_view environment) const {
    std::shared_lock lock(mutex_);
    auto it = settings_.find(core::to_lower(environment));
    if (it == settings_.end()) {
        return {};
    }
    return it->second.headers;
}

std::vector<std::string> EnvironmentRegistry::allowed() const {
    return config_.allowed;
}

}  // namespace conduit::gateway
