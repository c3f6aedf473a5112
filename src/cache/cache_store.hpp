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

// Conduit Cache Store - Header
// Pluggable key/value store for proxied responses (in-memory implementation here)

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace conduit::cache {

/// Cached backend response. Immutable once written; a write with the same key overwrites.
struct CacheEntry {
    std::string body;
    http::HeaderMap headers;
    int status_code = 200;
};

/// JSON encoding used by external stores
[[nodiscard]] std::string serialize_entry(const CacheEntry& entry);

/// Returns nullopt for anything that is not a serialized entry
[[nodiscard]] std::optional<CacheEntry> deserialize_entry(std::string_view data);

/// Cache store interface
/// get() returns nullopt on a miss; `error` is set only when the backend failed,
/// so callers can tell "not cached" from "cache unavailable".
class CacheStore {
public:
    virtual ~CacheStore() = default;

    [[nodiscard]] virtual std::optional<CacheEntry> get(std::string_view key, std::string& error) = 0;

    [[nodiscard]] virtual bool set(std::string_view key, const CacheEntry& entry,
                                   std::chrono::milliseconds ttl, std::string& error) = 0;

    /// Store name (for logs and health output)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Process-local store with per-entry expiry and bounded size
class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(size_t max_entries = 10000);
    ~MemoryCacheStore() override = default;

    // Non-copyable, non-movable (owns mutex)
    MemoryCacheStore(const MemoryCacheStore&) = delete;
    MemoryCacheStore& operator=(const MemoryCacheStore&) = delete;

    [[nodiscard]] std::optional<CacheEntry> get(std::string_view key, std::string& error) override;

    [[nodiscard]] bool set(std::string_view key, const CacheEntry& entry,
                           std::chrono::milliseconds ttl, std::string& error) override;

    [[nodiscard]] std::string_view name() const override { return "memory"; }

    /// Number of stored entries (expired ones included until purged)
    [[nodiscard]] size_t size() const;

    /// Drop expired entries, returns how many were removed
    size_t purge_expired();

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        CacheEntry entry;
        Clock::time_point expires_at;
    };

    /// Make room for one insert (caller holds the unique lock)
    void evict_for_insert(Clock::time_point now);

    size_t max_entries_;
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, Slot> entries_;
};

}  // namespace conduit::cache
