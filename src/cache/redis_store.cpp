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

// Conduit Redis Store - Implementation

#include "redis_store.hpp"

#include <exception>
#include <utility>

#include "../core/logging.hpp"

namespace conduit::cache {

namespace {

// Deletes the key only while it still holds our token
constexpr const char* RELEASE_SCRIPT =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) "
    "else return 0 end";

}  // namespace

// RedisCacheStore implementation

RedisCacheStore::RedisCacheStore(std::shared_ptr<core::RedisClient> client)
    : client_(std::move(client)), prefix_(client_->config().key_prefix) {}

std::optional<CacheEntry> RedisCacheStore::get(std::string_view key, std::string& error) {
    auto reply = client_->command({"GET", prefix_ + std::string(key)}, error);
    if (!reply) {
        return std::nullopt;
    }
    if (reply->is_error()) {
        error = "Redis GET error: " + reply->str;
        return std::nullopt;
    }
    if (reply->is_nil()) {
        return std::nullopt;
    }

    auto entry = deserialize_entry(reply->str);
    if (!entry) {
        // Foreign or corrupt value: treat as a miss, the next fill overwrites it
        LOG_WARNING(logging::get_logger(), "Discarding unreadable cache value for key {}", key);
    }
    return entry;
}

bool RedisCacheStore::set(std::string_view key, const CacheEntry& entry,
                          std::chrono::milliseconds ttl, std::string& error) {
    if (ttl.count() <= 0) {
        error = "TTL must be positive";
        return false;
    }

    std::string value = serialize_entry(entry);
    if (value.size() > client_->config().max_value_bytes) {
        error = "Entry of " + std::to_string(value.size()) + " bytes exceeds max_value_bytes";
        return false;
    }

    auto reply = client_->command(
        {"SET", prefix_ + std::string(key), std::move(value), "PX", std::to_string(ttl.count())},
        error);
    if (!reply) {
        return false;
    }
    if (!reply->is_ok()) {
        error = "Redis SET error: " + reply->str;
        return false;
    }
    return true;
}

// RedisLock implementation

RedisLock::RedisLock(std::shared_ptr<core::RedisClient> client)
    : client_(std::move(client)), prefix_(client_->config().key_prefix) {}

bool RedisLock::try_lock_once(const std::string& key, const std::string& token,
                              std::chrono::milliseconds lease, std::string& error) {
    auto reply = client_->command(
        {"SET", prefix_ + key, token, "NX", "PX", std::to_string(lease.count())}, error);
    if (!reply) {
        return false;
    }
    if (reply->is_error()) {
        error = "Redis lock error: " + reply->str;
        return false;
    }
    return reply->is_ok();  // Nil: held by someone else
}

void RedisLock::unlock(const std::string& key, const std::string& token) noexcept {
    try {
        std::string error;
        auto reply = client_->command({"EVAL", RELEASE_SCRIPT, "1", prefix_ + key, token}, error);
        if (!reply || reply->is_error()) {
            LOG_WARNING(logging::get_logger(), "Lock release for {} failed ({}), lease will expire",
                        key, reply ? reply->str : error);
        }
    } catch (const std::exception& e) {
        LOG_WARNING(logging::get_logger(), "Lock release for {} threw: {}", key, e.what());
    }
}

}  // namespace conduit::cache
