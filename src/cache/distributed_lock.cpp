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

// Conduit Distributed Lock - Implementation

#include "distributed_lock.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "../core/crypto.hpp"

namespace conduit::cache {

// LockHandle implementation

LockHandle::LockHandle(DistributedLock* owner, std::string key, std::string token)
    : owner_(owner), key_(std::move(key)), token_(std::move(token)) {}

LockHandle::~LockHandle() {
    release();
}

LockHandle::LockHandle(LockHandle&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      key_(std::move(other.key_)),
      token_(std::move(other.token_)) {}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        key_ = std::move(other.key_);
        token_ = std::move(other.token_);
    }
    return *this;
}

void LockHandle::release() noexcept {
    if (auto* owner = std::exchange(owner_, nullptr)) {
        owner->unlock(key_, token_);
    }
}

// DistributedLock implementation

std::optional<LockHandle> DistributedLock::try_acquire(std::string_view key, const LockTiming& timing) {
    std::string error;
    return try_acquire(key, timing, error);
}

std::optional<LockHandle> DistributedLock::try_acquire(std::string_view key, const LockTiming& timing,
                                                       std::string& error) {
    std::string k(key);
    std::string token = core::random_hex(16);
    auto deadline = std::chrono::steady_clock::now() + timing.max_wait;

    while (true) {
        if (try_lock_once(k, token, timing.lease, error)) {
            return LockHandle(this, std::move(k), std::move(token));
        }
        if (!error.empty()) {
            return std::nullopt;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(timing.poll_interval, remaining));
    }
}

// MemoryLock implementation

size_t MemoryLock::held_count() const {
    std::lock_guard lock(mutex_);
    return leases_.size();
}

bool MemoryLock::try_lock_once(const std::string& key, const std::string& token,
                               std::chrono::milliseconds lease, std::string& error) {
    (void)error;

    auto now = Clock::now();
    std::lock_guard lock(mutex_);

    auto it = leases_.find(key);
    if (it != leases_.end() && it->second.expires_at > now) {
        return false;
    }

    leases_[key] = Lease{token, now + lease};
    return true;
}

void MemoryLock::unlock(const std::string& key, const std::string& token) noexcept {
    std::lock_guard lock(mutex_);
    auto it = leases_.find(key);
    if (it != leases_.end() && it->second.token == token) {
        leases_.erase(it);
    }
}

}  // namespace conduit::cache
