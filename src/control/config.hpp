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

// Conduit Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"

namespace conduit::control {

/// Front-end HTTP server configuration
struct ServerConfig {
    uint32_t worker_threads = 0;  // 0 = auto-detect CPU count

    // Network settings
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;
    uint32_t write_timeout = 60000;

    // Limits
    uint32_t max_request_size = 10485760;  // 10MB

    // Public base URL used when rewriting backend URLs (empty = scheme://Host of the request)
    std::string public_base_url;
};

/// Backend invocation settings (shared by proxy and composite calls)
struct BackendConfig {
    uint32_t connect_timeout_ms = 10000;
    uint32_t timeout_ms = 30000;
    bool verify_tls = true;
};

/// Redis connection for the external cache store and lock
struct RedisConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    uint32_t timeout_ms = 1000;
    std::string password;                  // Empty = no AUTH
    std::string key_prefix = "conduit:";   // Prepended to every key
    size_t max_value_bytes = 8388608;      // 8MB
};

/// Stampede lock timing
struct LockConfig {
    uint32_t lease_ms = 30000;         // Lock TTL (crashed holder bound)
    uint32_t max_wait_ms = 10000;      // Give up and recompute uncached after this
    uint32_t poll_interval_ms = 200;   // Retry interval while waiting
};

/// Response cache configuration
struct CacheConfig {
    bool enabled = true;
    std::string provider = "memory";  // memory, redis
    uint32_t default_duration_seconds = 300;
    size_t max_entries = 10000;       // Memory provider capacity

    // Per-endpoint durations (seconds), endpoint names case-insensitive
    core::fast_map<std::string, uint32_t> endpoint_durations;

    std::vector<std::string> cacheable_content_types = {
        "application/json", "text/json", "application/xml", "text/xml", "text/plain"};

    RedisConfig redis;
    LockConfig lock;
};

/// Endpoint definition files
struct EndpointsConfig {
    std::string directory = "endpoints";
};

/// Environment settings files and global allow-list
struct EnvironmentsConfig {
    std::string directory = "environments";
    std::vector<std::string> allowed;  // Empty = every environment allowed
};

/// Authentication configuration (bearer token validation)
struct AuthConfig {
    bool enabled = false;
    std::string header = "Authorization";
    std::vector<std::string> valid_tokens;
    std::vector<std::string> exempt_paths = {"/health/live"};
};

/// Security response headers
struct SecurityHeadersConfig {
    bool enabled = true;
    std::string content_security_policy = "default-src 'self'";
    std::string frame_options = "DENY";
    std::string referrer_policy = "strict-origin-when-cross-origin";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";               // debug, info, warning, error
    std::string format = "json";              // json, text
    std::string output = "/var/log/conduit";  // Log directory (conduit.log appended) or "console"
    bool log_requests = true;
    std::vector<std::string> exclude_paths;   // Don't log these paths

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Conduit configuration
struct Config {
    ServerConfig server;
    BackendConfig backend;
    CacheConfig cache;
    EndpointsConfig endpoints;
    EnvironmentsConfig environments;
    AuthConfig auth;
    SecurityHeadersConfig security_headers;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json so partial documents pick up defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.worker_threads = j.value("worker_threads", 0u);
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.read_timeout = j.value("read_timeout", 60000u);
    s.write_timeout = j.value("write_timeout", 60000u);
    s.max_request_size = j.value("max_request_size", 10485760u);
    s.public_base_url = j.value("public_base_url", std::string());
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"worker_threads", s.worker_threads},
                       {"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"read_timeout", s.read_timeout},
                       {"write_timeout", s.write_timeout},
                       {"max_request_size", s.max_request_size},
                       {"public_base_url", s.public_base_url}};
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    b.connect_timeout_ms = j.value("connect_timeout_ms", 10000u);
    b.timeout_ms = j.value("timeout_ms", 30000u);
    b.verify_tls = j.value("verify_tls", true);
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"connect_timeout_ms", b.connect_timeout_ms},
                       {"timeout_ms", b.timeout_ms},
                       {"verify_tls", b.verify_tls}};
}

inline void from_json(const nlohmann::json& j, RedisConfig& r) {
    r.host = j.value("host", std::string("127.0.0.1"));
    r.port = j.value("port", uint16_t(6379));
    r.timeout_ms = j.value("timeout_ms", 1000u);
    r.password = j.value("password", std::string());
    r.key_prefix = j.value("key_prefix", std::string("conduit:"));
    r.max_value_bytes = j.value("max_value_bytes", size_t(8388608));
}

inline void to_json(nlohmann::json& j, const RedisConfig& r) {
    // Password is never serialized back out
    j = nlohmann::json{{"host", r.host},
                       {"port", r.port},
                       {"timeout_ms", r.timeout_ms},
                       {"key_prefix", r.key_prefix},
                       {"max_value_bytes", r.max_value_bytes}};
}

inline void from_json(const nlohmann::json& j, LockConfig& l) {
    l.lease_ms = j.value("lease_ms", 30000u);
    l.max_wait_ms = j.value("max_wait_ms", 10000u);
    l.poll_interval_ms = j.value("poll_interval_ms", 200u);
}

inline void to_json(nlohmann::json& j, const LockConfig& l) {
    j = nlohmann::json{{"lease_ms", l.lease_ms},
                       {"max_wait_ms", l.max_wait_ms},
                       {"poll_interval_ms", l.poll_interval_ms}};
}

inline void from_json(const nlohmann::json& j, CacheConfig& c) {
    c.enabled = j.value("enabled", true);
    c.provider = j.value("provider", std::string("memory"));
    c.default_duration_seconds = j.value("default_duration_seconds", 300u);
    c.max_entries = j.value("max_entries", size_t(10000));
    // Use contains() for complex types to avoid infinite recursion
    if (j.contains("endpoint_durations")) {
        for (const auto& [name, seconds] : j.at("endpoint_durations").items()) {
            c.endpoint_durations[name] = seconds.get<uint32_t>();
        }
    }
    if (j.contains("cacheable_content_types")) {
        j.at("cacheable_content_types").get_to(c.cacheable_content_types);
    }
    if (j.contains("redis")) {
        j.at("redis").get_to(c.redis);
    }
    if (j.contains("lock")) {
        j.at("lock").get_to(c.lock);
    }
}

inline void to_json(nlohmann::json& j, const CacheConfig& c) {
    nlohmann::json durations = nlohmann::json::object();
    for (const auto& [name, seconds] : c.endpoint_durations) {
        durations[name] = seconds;
    }
    j["enabled"] = c.enabled;
    j["provider"] = c.provider;
    j["default_duration_seconds"] = c.default_duration_seconds;
    j["max_entries"] = c.max_entries;
    j["endpoint_durations"] = durations;
    j["cacheable_content_types"] = c.cacheable_content_types;
    j["redis"] = c.redis;
    j["lock"] = c.lock;
}

inline void from_json(const nlohmann::json& j, EndpointsConfig& e) {
    e.directory = j.value("directory", std::string("endpoints"));
}

inline void to_json(nlohmann::json& j, const EndpointsConfig& e) {
    j = nlohmann::json{{"directory", e.directory}};
}

inline void from_json(const nlohmann::json& j, EnvironmentsConfig& e) {
    e.directory = j.value("directory", std::string("environments"));
    e.allowed = j.value("allowed", std::vector<std::string>());
}

inline void to_json(nlohmann::json& j, const EnvironmentsConfig& e) {
    j = nlohmann::json{{"directory", e.directory}, {"allowed", e.allowed}};
}

inline void from_json(const nlohmann::json& j, AuthConfig& a) {
    a.enabled = j.value("enabled", false);
    a.header = j.value("header", std::string("Authorization"));
    a.valid_tokens = j.value("valid_tokens", std::vector<std::string>());
    a.exempt_paths = j.value("exempt_paths", std::vector<std::string>{"/health/live"});
}

inline void to_json(nlohmann::json& j, const AuthConfig& a) {
    // Tokens are secrets, only their count is exported
    j = nlohmann::json{{"enabled", a.enabled},
                       {"header", a.header},
                       {"valid_token_count", a.valid_tokens.size()},
                       {"exempt_paths", a.exempt_paths}};
}

inline void from_json(const nlohmann::json& j, SecurityHeadersConfig& s) {
    s.enabled = j.value("enabled", true);
    s.content_security_policy =
        j.value("content_security_policy", std::string("default-src 'self'"));
    s.frame_options = j.value("frame_options", std::string("DENY"));
    s.referrer_policy = j.value("referrer_policy", std::string("strict-origin-when-cross-origin"));
}

inline void to_json(nlohmann::json& j, const SecurityHeadersConfig& s) {
    j = nlohmann::json{{"enabled", s.enabled},
                       {"content_security_policy", s.content_security_policy},
                       {"frame_options", s.frame_options},
                       {"referrer_policy", s.referrer_policy}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/conduit"));
    l.log_requests = j.value("log_requests", true);
    l.exclude_paths = j.value("exclude_paths", std::vector<std::string>());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"exclude_paths", l.exclude_paths},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get_to() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("backend")) {
        j.at("backend").get_to(c.backend);
    }
    if (j.contains("cache")) {
        j.at("cache").get_to(c.cache);
    }
    if (j.contains("endpoints")) {
        j.at("endpoints").get_to(c.endpoints);
    }
    if (j.contains("environments")) {
        j.at("environments").get_to(c.environments);
    }
    if (j.contains("auth")) {
        j.at("auth").get_to(c.auth);
    }
    if (j.contains("security_headers")) {
        j.at("security_headers").get_to(c.security_headers);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j.at("description").is_string()) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["backend"] = c.backend;
    j["cache"] = c.cache;
    j["endpoints"] = c.endpoints;
    j["environments"] = c.environments;
    j["auth"] = c.auth;
    j["security_headers"] = c.security_headers;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    void merge(const ValidationResult& other) {
        for (const auto& e : other.errors) {
            add_error(e);
        }
        for (const auto& w : other.warnings) {
            add_warning(w);
        }
    }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);

    /// Top-level sections whose values differ, in declaration order.
    /// Secrets (auth tokens, redis password) are compared too.
    [[nodiscard]] static std::vector<std::string> changed_sections(const Config& before,
                                                                   const Config& after);
};

/// Configuration manager (hot-reload via atomic snapshot swap)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration from the same file
    [[nodiscard]] bool reload();

    /// Get current configuration snapshot
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Validation result of the last load/reload
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace conduit::control
