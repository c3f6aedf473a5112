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

// Conduit Cache Store - Implementation

#include "cache_store.hpp"

#include <mutex>
#include <nlohmann/json.hpp>

namespace conduit::cache {

std::string serialize_entry(const CacheEntry& entry) {
    nlohmann::json headers = nlohmann::json::object();
    for (const auto& [name, value] : entry.headers) {
        headers[name] = value;
    }

    nlohmann::json j = {{"status", entry.status_code}, {"headers", headers}, {"body", entry.body}};
    // Bodies are not guaranteed to be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<CacheEntry> deserialize_entry(std::string_view data) {
    try {
        auto j = nlohmann::json::parse(data);
        if (!j.is_object() || !j.contains("status") || !j.contains("body")) {
            return std::nullopt;
        }

        CacheEntry entry;
        entry.status_code = j.at("status").get<int>();
        entry.body = j.at("body").get<std::string>();
        if (j.contains("headers") && j.at("headers").is_object()) {
            for (const auto& [name, value] : j.at("headers").items()) {
                if (value.is_string()) {
                    entry.headers[name] = value.get<std::string>();
                }
            }
        }
        return entry;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// MemoryCacheStore implementation

namespace {

template <typename Map, typename TimePoint>
size_t erase_expired(Map& entries, TimePoint now) {
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.expires_at <= now) {
            it = entries.erase(it);  // Dense map: erase moves the last element into place
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // namespace

MemoryCacheStore::MemoryCacheStore(size_t max_entries) : max_entries_(max_entries) {}

std::optional<CacheEntry> MemoryCacheStore::get(std::string_view key, std::string& error) {
    (void)error;  // In-process store cannot be unavailable

    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= Clock::now()) {
        return std::nullopt;  // Expired, removed lazily on the next write
    }
    return it->second.entry;
}

bool MemoryCacheStore::set(std::string_view key, const CacheEntry& entry,
                           std::chrono::milliseconds ttl, std::string& error) {
    if (ttl.count() <= 0) {
        error = "TTL must be positive";
        return false;
    }

    auto now = Clock::now();
    std::unique_lock lock(mutex_);

    std::string k(key);
    auto it = entries_.find(k);
    if (it != entries_.end()) {
        it->second = Slot{entry, now + ttl};
        return true;
    }

    evict_for_insert(now);
    entries_.emplace(std::move(k), Slot{entry, now + ttl});
    return true;
}

size_t MemoryCacheStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

size_t MemoryCacheStore::purge_expired() {
    auto now = Clock::now();
    std::unique_lock lock(mutex_);
    return erase_expired(entries_, now);
}

void MemoryCacheStore::evict_for_insert(Clock::time_point now) {
    if (entries_.size() < max_entries_) {
        return;
    }

    erase_expired(entries_, now);
    if (entries_.size() < max_entries_) {
        return;
    }

    // Still full: drop the entry closest to expiry
    auto victim = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.expires_at < victim->second.expires_at) {
            victim = it;
        }
    }
    if (victim != entries_.end()) {
        entries_.erase(victim);
    }
}

}  // namespace conduit::cache
