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

// Conduit Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/string_utils.hpp"
#include "config_validator.hpp"

namespace conduit::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    if (validation.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }
    if (config.server.worker_threads > 1024) {
        result.add_warning("Server worker_threads > 1024 (" +
                           std::to_string(config.server.worker_threads) + ")");
    }
    if (!config.server.public_base_url.empty() &&
        config.server.public_base_url.rfind("http://", 0) != 0 &&
        config.server.public_base_url.rfind("https://", 0) != 0) {
        result.add_error("Server public_base_url must start with http:// or https://");
    }

    // Backend
    if (config.backend.timeout_ms == 0) {
        result.add_error("Backend timeout_ms must be > 0");
    }
    if (config.backend.connect_timeout_ms == 0) {
        result.add_error("Backend connect_timeout_ms must be > 0");
    }

    // Cache
    const auto& cache = config.cache;
    if (cache.provider != "memory" && cache.provider != "redis") {
        result.add_error("Cache provider '" + cache.provider + "' is invalid (must be 'memory' or 'redis')");
    }
    if (cache.provider == "memory" && cache.max_entries == 0) {
        result.add_error("Cache max_entries must be > 0 for the memory provider");
    }
    if (cache.provider == "redis") {
        if (cache.redis.host.empty()) {
            result.add_error("Cache redis.host cannot be empty");
        }
        if (cache.redis.port == 0) {
            result.add_error("Cache redis.port must be > 0");
        }
        if (cache.redis.timeout_ms == 0) {
            result.add_error("Cache redis.timeout_ms must be > 0");
        }
    }
    if (cache.default_duration_seconds == 0) {
        result.add_warning(
            "Cache default_duration_seconds is 0: responses without max-age will not be cached");
    }
    if (cache.enabled && cache.cacheable_content_types.empty()) {
        result.add_warning("Cache is enabled but cacheable_content_types is empty");
    }

    // Lock
    const auto& lock = cache.lock;
    if (lock.lease_ms == 0) {
        result.add_error("Cache lock.lease_ms must be > 0");
    }
    if (lock.poll_interval_ms == 0) {
        result.add_error("Cache lock.poll_interval_ms must be > 0");
    }
    if (lock.max_wait_ms < lock.poll_interval_ms) {
        result.add_warning("Cache lock.max_wait_ms is shorter than poll_interval_ms");
    }
    if (lock.lease_ms < config.backend.timeout_ms) {
        result.add_warning("Cache lock.lease_ms (" + std::to_string(lock.lease_ms) +
                           ") is shorter than backend timeout_ms (" +
                           std::to_string(config.backend.timeout_ms) +
                           "): a slow backend call can outlive its lock");
    }

    // Endpoints / environments
    if (config.endpoints.directory.empty()) {
        result.add_error("Endpoints directory cannot be empty");
    }
    if (config.environments.directory.empty()) {
        result.add_error("Environments directory cannot be empty");
    }
    if (config.environments.allowed.empty()) {
        result.add_warning("Environments allow-list is empty: every environment is allowed");
    }

    // Auth
    if (config.auth.enabled && config.auth.valid_tokens.empty()) {
        result.add_error("Auth is enabled but no valid_tokens are configured");
    }
    if (config.auth.header.empty()) {
        result.add_error("Auth header cannot be empty");
    }

    // Logging
    auto level = core::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_error("Logging level '" + config.logging.level + "' is invalid");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Logging format '" + config.logging.format +
                         "' is invalid (must be 'json' or 'text')");
    }

    // Name security and typo checks
    result.merge(ConfigValidator::validate(config));

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        last_validation_ = ValidationResult{};
        last_validation_.add_error("Cannot open configuration file: " + path_str);
        return false;
    }

    Config parsed;
    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        parsed = nlohmann::json::parse(buffer.str()).get<Config>();
    } catch (const nlohmann::json::exception& e) {
        last_validation_ = ValidationResult{};
        last_validation_.add_error(std::string("JSON parsing error: ") + e.what());
        return false;
    }

    last_validation_ = ConfigLoader::validate(parsed);
    if (last_validation_.has_errors()) {
        return false;
    }

    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(parsed)));
    return true;
}

std::vector<std::string> ConfigLoader::changed_sections(const Config& before, const Config& after) {
    std::vector<std::string> changed;
    auto differs = [](const auto& a, const auto& b) { return nlohmann::json(a) != nlohmann::json(b); };
    auto mark = [&changed](const char* name, bool different) {
        if (different) {
            changed.emplace_back(name);
        }
    };

    // Serialized forms leave secrets out, so those are compared directly
    mark("server", differs(before.server, after.server));
    mark("backend", differs(before.backend, after.backend));
    mark("cache", differs(before.cache, after.cache) ||
                      before.cache.redis.password != after.cache.redis.password);
    mark("endpoints", differs(before.endpoints, after.endpoints));
    mark("environments", differs(before.environments, after.environments));
    mark("auth", differs(before.auth, after.auth) || before.auth.valid_tokens != after.auth.valid_tokens);
    mark("security_headers", differs(before.security_headers, after.security_headers));
    mark("logging", differs(before.logging, after.logging));
    return changed;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    // load() only swaps the snapshot after validation passes, so a bad file keeps the old one
    std::string path = config_path_;
    return load(path);
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    // Atomic load - safe for concurrent readers
    return std::atomic_load(&current_config_);
}

}  // namespace conduit::control
