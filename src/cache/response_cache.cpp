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

// Conduit Response Cache - Implementation

#include "response_cache.hpp"

#include <charconv>
#include <utility>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/regex.hpp"

namespace conduit::cache {

std::string build_cache_key(const CacheKeyParts& parts) {
    std::string key = "proxy:";
    key.append(parts.environment);
    key += ':';
    key.append(parts.endpoint);
    key += ':';
    key.append(parts.path);
    key += ':';
    key.append(parts.query);

    if (!parts.authorization.empty()) {
        key += ":auth:";
        key += core::base64_encode(core::sha256(parts.authorization));
    }
    if (!parts.accept_language.empty()) {
        key += ":lang:";
        key.append(parts.accept_language);
    }
    return key;
}

std::string lock_key_for(std::string_view cache_key) {
    std::string key = "lock:";
    key.append(cache_key);
    return key;
}

std::optional<std::chrono::seconds> parse_max_age(std::string_view cache_control) {
    static const auto pattern = http::Regex::compile(R"((?i)max-age\s*=\s*(\d+))");
    if (!pattern || cache_control.empty()) {
        return std::nullopt;
    }

    auto groups = pattern->extract_groups(cache_control);
    if (groups.size() < 2 || groups[1].empty()) {
        return std::nullopt;
    }

    uint64_t seconds = 0;
    auto digits = groups[1];
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seconds);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;  // Overflow
    }
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
}

// CachePolicy implementation

CachePolicy CachePolicy::from_config(const control::CacheConfig& config) {
    CachePolicy policy;
    policy.default_ttl = std::chrono::seconds(config.default_duration_seconds);
    for (const auto& [endpoint, seconds] : config.endpoint_durations) {
        policy.endpoint_ttls[core::to_lower(endpoint)] = seconds;
    }
    for (const auto& type : config.cacheable_content_types) {
        policy.cacheable_content_types.push_back(http::media_type(type));
    }
    policy.lock.lease = std::chrono::milliseconds(config.lock.lease_ms);
    policy.lock.max_wait = std::chrono::milliseconds(config.lock.max_wait_ms);
    policy.lock.poll_interval = std::chrono::milliseconds(config.lock.poll_interval_ms);
    return policy;
}

bool CachePolicy::is_cacheable_content_type(std::string_view content_type) const {
    if (content_type.empty()) {
        return false;
    }
    auto type = http::media_type(content_type);
    for (const auto& allowed : cacheable_content_types) {
        if (type == allowed) {
            return true;
        }
    }
    return false;
}

std::chrono::seconds CachePolicy::ttl_for(std::string_view endpoint,
                                          const http::HeaderMap& response_headers,
                                          std::optional<std::chrono::seconds> endpoint_ttl) const {
    if (auto max_age = parse_max_age(http::find_header(response_headers, "Cache-Control"))) {
        return *max_age;
    }
    if (endpoint_ttl) {
        return *endpoint_ttl;
    }
    auto it = endpoint_ttls.find(core::to_lower(endpoint));
    if (it != endpoint_ttls.end()) {
        return std::chrono::seconds(it->second);
    }
    return default_ttl;
}

std::string_view to_string(CacheOutcome outcome) noexcept {
    switch (outcome) {
        case CacheOutcome::Hit:
            return "HIT";
        case CacheOutcome::HitAfterWait:
            return "HIT-WAIT";
        case CacheOutcome::Stored:
            return "MISS";
        case CacheOutcome::NotStored:
            return "MISS-NOSTORE";
        case CacheOutcome::LockTimeout:
            return "LOCK-TIMEOUT";
        case CacheOutcome::Degraded:
            return "BYPASS";
    }
    return "UNKNOWN";
}

// ResponseCacheEngine implementation

namespace {

CachedResponse from_entry(CacheEntry entry) {
    CachedResponse response;
    response.status_code = entry.status_code;
    response.headers = std::move(entry.headers);
    response.body = std::move(entry.body);
    return response;
}

}  // namespace

ResponseCacheEngine::ResponseCacheEngine(std::shared_ptr<CacheStore> store,
                                         std::shared_ptr<DistributedLock> lock, CachePolicy policy)
    : store_(std::move(store)), lock_(std::move(lock)), policy_(std::move(policy)) {}

CacheResult ResponseCacheEngine::handle_cacheable_get(const std::string& cache_key,
                                                      const std::string& lock_key,
                                                      std::string_view endpoint,
                                                      const Recompute& recompute,
                                                      std::optional<std::chrono::seconds> endpoint_ttl) {
    auto* logger = logging::get_logger();

    std::string error;
    if (auto entry = store_->get(cache_key, error)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return {from_entry(std::move(*entry)), CacheOutcome::Hit};
    }
    if (!error.empty()) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "Cache read failed for {}: {}, serving uncached", cache_key, error);
        return {recompute(), CacheOutcome::Degraded};
    }

    misses_.fetch_add(1, std::memory_order_relaxed);

    auto handle = lock_->try_acquire(lock_key, policy_.lock, error);
    if (!handle) {
        if (!error.empty()) {
            backend_errors_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARNING(logger, "Lock backend failed for {}: {}, serving uncached", lock_key, error);
            return {recompute(), CacheOutcome::Degraded};
        }
        lock_timeouts_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "Lock wait for {} exceeded {}ms, serving uncached", lock_key,
                    policy_.lock.max_wait.count());
        return {recompute(), CacheOutcome::LockTimeout};
    }

    // Whoever held the lock before us may have filled the entry
    if (auto entry = store_->get(cache_key, error)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return {from_entry(std::move(*entry)), CacheOutcome::HitAfterWait};
    }
    if (!error.empty()) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "Cache re-read failed for {}: {}, serving uncached", cache_key, error);
        return {recompute(), CacheOutcome::Degraded};
    }

    CacheResult result;
    result.response = recompute();
    result.outcome = maybe_store(cache_key, endpoint, endpoint_ttl, result.response);
    handle->release();
    return result;
}

CacheStats ResponseCacheEngine::stats() const noexcept {
    CacheStats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.stores = stores_.load(std::memory_order_relaxed);
    s.lock_timeouts = lock_timeouts_.load(std::memory_order_relaxed);
    s.backend_errors = backend_errors_.load(std::memory_order_relaxed);
    return s;
}

CacheOutcome ResponseCacheEngine::maybe_store(const std::string& cache_key,
                                              std::string_view endpoint,
                                              std::optional<std::chrono::seconds> endpoint_ttl,
                                              const CachedResponse& response) {
    if (!http::is_success(response.status_code) ||
        !policy_.is_cacheable_content_type(response.content_type())) {
        return CacheOutcome::NotStored;
    }

    auto ttl = policy_.ttl_for(endpoint, response.headers, endpoint_ttl);
    if (ttl.count() <= 0) {
        return CacheOutcome::NotStored;
    }

    CacheEntry entry{response.body, response.headers, response.status_code};
    std::string error;
    if (!store_->set(cache_key, entry, std::chrono::duration_cast<std::chrono::milliseconds>(ttl),
                     error)) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logging::get_logger(), "Cache write failed for {}: {}", cache_key, error);
        return CacheOutcome::NotStored;
    }

    stores_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG(logging::get_logger(), "Cached {} for {}s", cache_key, ttl.count());
    return CacheOutcome::Stored;
}

}  // namespace conduit::cache
