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

// Conduit Response Cache - Header
// Cache-aside engine for proxied GET responses with stampede protection

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../http/http.hpp"
#include "cache_store.hpp"
#include "distributed_lock.hpp"

namespace conduit::cache {

/// Inputs that distinguish one cached response from another
struct CacheKeyParts {
    std::string_view environment;
    std::string_view endpoint;
    std::string_view path;             // Sub-path after the endpoint name
    std::string_view query;            // Raw query string without '?'
    std::string_view authorization;    // Authorization header, empty if absent
    std::string_view accept_language;  // Accept-Language header, empty if absent
};

/// proxy:{env}:{endpoint}:{path}:{query}[:auth:{b64(sha256)}][:lang:{lang}]
/// The credential itself never appears in the key.
[[nodiscard]] std::string build_cache_key(const CacheKeyParts& parts);

/// Lock key guarding the fill of `cache_key`
[[nodiscard]] std::string lock_key_for(std::string_view cache_key);

/// Seconds from a Cache-Control max-age directive
[[nodiscard]] std::optional<std::chrono::seconds> parse_max_age(std::string_view cache_control);

/// TTL and admission rules
struct CachePolicy {
    std::chrono::seconds default_ttl{300};
    core::fast_map<std::string, uint32_t> endpoint_ttls;  // Keys lower-cased
    std::vector<std::string> cacheable_content_types;     // Media types, lower-cased
    LockTiming lock;

    [[nodiscard]] static CachePolicy from_config(const control::CacheConfig& config);

    /// Media type (parameters ignored) is on the allow-list
    [[nodiscard]] bool is_cacheable_content_type(std::string_view content_type) const;

    /// Backend max-age, then the endpoint definition's duration, then the duration
    /// configured for the endpoint name, then the default
    [[nodiscard]] std::chrono::seconds ttl_for(
        std::string_view endpoint, const http::HeaderMap& response_headers,
        std::optional<std::chrono::seconds> endpoint_ttl = std::nullopt) const;
};

/// Response as produced by the recompute callback (post-rewrite)
struct CachedResponse {
    int status_code = 200;
    http::HeaderMap headers;
    std::string body;

    [[nodiscard]] std::string_view content_type() const {
        return http::find_header(headers, "Content-Type");
    }
};

/// How a request was served (reported as X-Cache and in metrics)
enum class CacheOutcome : uint8_t {
    Hit,           // Served from the store
    HitAfterWait,  // Filled by another caller while we held or waited for the lock
    Stored,        // Recomputed and written
    NotStored,     // Recomputed, not admissible (status, content type or zero TTL)
    LockTimeout,   // Waited max_wait, recomputed without caching
    Degraded       // Store or lock backend failed, recomputed without caching
};

[[nodiscard]] std::string_view to_string(CacheOutcome outcome) noexcept;

struct CacheResult {
    CachedResponse response;
    CacheOutcome outcome = CacheOutcome::NotStored;
};

/// Counters snapshot
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t stores = 0;
    uint64_t lock_timeouts = 0;
    uint64_t backend_errors = 0;
};

/// Cache-aside with a distributed lock around the fill
/// Concurrent misses on one key collapse to a single recompute; waiters
/// re-read the store after the holder finishes.
class ResponseCacheEngine {
public:
    using Recompute = std::function<CachedResponse()>;

    ResponseCacheEngine(std::shared_ptr<CacheStore> store, std::shared_ptr<DistributedLock> lock,
                        CachePolicy policy);

    // Non-copyable (owns counters)
    ResponseCacheEngine(const ResponseCacheEngine&) = delete;
    ResponseCacheEngine& operator=(const ResponseCacheEngine&) = delete;

    /// Serve from cache or recompute. Exceptions from `recompute` propagate
    /// (any lock held is released first).
    [[nodiscard]] CacheResult handle_cacheable_get(
        const std::string& cache_key, const std::string& lock_key, std::string_view endpoint,
        const Recompute& recompute, std::optional<std::chrono::seconds> endpoint_ttl = std::nullopt);

    [[nodiscard]] const CachePolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] CacheStats stats() const noexcept;

    [[nodiscard]] std::string_view store_name() const { return store_->name(); }
    [[nodiscard]] std::string_view lock_name() const { return lock_->name(); }

private:
    /// Write if admissible; returns Stored or NotStored
    CacheOutcome maybe_store(const std::string& cache_key, std::string_view endpoint,
                             std::optional<std::chrono::seconds> endpoint_ttl,
                             const CachedResponse& response);

    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<DistributedLock> lock_;
    CachePolicy policy_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> lock_timeouts_{0};
    std::atomic<uint64_t> backend_errors_{0};
};

}  // namespace conduit::cache
