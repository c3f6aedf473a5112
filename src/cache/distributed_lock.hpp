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

// Conduit Distributed Lock - Header
// Named, lease-based mutual exclusion used to collapse concurrent cache fills

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../core/containers.hpp"

namespace conduit::cache {

class DistributedLock;

/// Lease timing for one acquisition attempt
struct LockTiming {
    std::chrono::milliseconds lease{30000};
    std::chrono::milliseconds max_wait{10000};
    std::chrono::milliseconds poll_interval{200};
};

/// Exclusive hold on a lock key. Move-only; released exactly once,
/// either explicitly or when the handle goes out of scope.
class LockHandle {
public:
    LockHandle() = default;
    LockHandle(DistributedLock* owner, std::string key, std::string token);
    ~LockHandle();

    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;
    LockHandle(LockHandle&& other) noexcept;
    LockHandle& operator=(LockHandle&& other) noexcept;

    /// Give the lease back. Further calls are no-ops.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& token() const noexcept { return token_; }

private:
    DistributedLock* owner_ = nullptr;
    std::string key_;
    std::string token_;
};

/// Lock backend interface
/// try_acquire() polls try_lock_once() until it succeeds or max_wait elapses.
/// A lease that is never released expires on its own after `lease`.
class DistributedLock {
public:
    virtual ~DistributedLock() = default;

    /// Acquire or give up after timing.max_wait. nullopt means timed out.
    [[nodiscard]] std::optional<LockHandle> try_acquire(std::string_view key, const LockTiming& timing);

    /// As above; `error` is set (and the wait abandoned) when the backend fails
    [[nodiscard]] std::optional<LockHandle> try_acquire(std::string_view key, const LockTiming& timing,
                                                        std::string& error);

    [[nodiscard]] virtual std::string_view name() const = 0;

protected:
    /// Single non-blocking attempt. True when the key was free (or its lease had
    /// expired) and is now held under `token`.
    [[nodiscard]] virtual bool try_lock_once(const std::string& key, const std::string& token,
                                             std::chrono::milliseconds lease, std::string& error) = 0;

    /// Drop the lease, but only if it is still held under `token`
    virtual void unlock(const std::string& key, const std::string& token) noexcept = 0;

    friend class LockHandle;
};

/// Process-local lock table with lease expiry
class MemoryLock : public DistributedLock {
public:
    MemoryLock() = default;

    // Non-copyable, non-movable (owns mutex)
    MemoryLock(const MemoryLock&) = delete;
    MemoryLock& operator=(const MemoryLock&) = delete;

    [[nodiscard]] std::string_view name() const override { return "memory"; }

    /// Number of keys currently leased (expired leases included until reused)
    [[nodiscard]] size_t held_count() const;

protected:
    [[nodiscard]] bool try_lock_once(const std::string& key, const std::string& token,
                                     std::chrono::milliseconds lease, std::string& error) override;
    void unlock(const std::string& key, const std::string& token) noexcept override;

private:
    using Clock = std::chrono::steady_clock;

    struct Lease {
        std::string token;
        Clock::time_point expires_at;
    };

    mutable std::mutex mutex_;
    core::fast_map<std::string, Lease> leases_;
};

}  // namespace conduit::cache
