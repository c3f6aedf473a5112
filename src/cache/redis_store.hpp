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

// Conduit Redis Store - Header
// Shared cache store and lock over Redis, for multi-instance deployments

#pragma once

#include <memory>
#include <string>

#include "../core/redis_client.hpp"
#include "cache_store.hpp"
#include "distributed_lock.hpp"

namespace conduit::cache {

/// Entries are stored as serialized JSON under `key_prefix + key` with PX expiry
class RedisCacheStore : public CacheStore {
public:
    explicit RedisCacheStore(std::shared_ptr<core::RedisClient> client);

    [[nodiscard]] std::optional<CacheEntry> get(std::string_view key, std::string& error) override;

    [[nodiscard]] bool set(std::string_view key, const CacheEntry& entry,
                           std::chrono::milliseconds ttl, std::string& error) override;

    [[nodiscard]] std::string_view name() const override { return "redis"; }

private:
    std::shared_ptr<core::RedisClient> client_;
    std::string prefix_;
};

/// SET NX PX acquisition, compare-and-delete release
class RedisLock : public DistributedLock {
public:
    explicit RedisLock(std::shared_ptr<core::RedisClient> client);

    [[nodiscard]] std::string_view name() const override { return "redis"; }

protected:
    [[nodiscard]] bool try_lock_once(const std::string& key, const std::string& token,
                                     std::chrono::milliseconds lease, std::string& error) override;
    void unlock(const std::string& key, const std::string& token) noexcept override;

private:
    std::shared_ptr<core::RedisClient> client_;
    std::string prefix_;
};

}  // namespace conduit::cache
