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

// Gateway Component Factory - Header
// Factory functions for building gateway components (Pipeline, Cache, Dispatcher)

#pragma once

#include <memory>

#include "../cache/cache_store.hpp"
#include "../cache/distributed_lock.hpp"
#include "../cache/response_cache.hpp"
#include "../control/config.hpp"
#include "../core/redis_client.hpp"
#include "backend_invoker.hpp"
#include "dispatcher.hpp"
#include "pipeline.hpp"

namespace conduit::gateway {

/// Store and lock sharing one provider
struct CacheBackends {
    std::shared_ptr<cache::CacheStore> store;
    std::shared_ptr<cache::DistributedLock> lock;
    std::shared_ptr<core::RedisClient> redis;  // Set for the redis provider only
};

/// Assembled gateway
struct Gateway {
    DispatcherServices services;
    std::shared_ptr<core::RedisClient> redis;
    std::unique_ptr<Dispatcher> dispatcher;
};

/// Build middleware pipeline from configuration
[[nodiscard]] Pipeline build_pipeline(const control::Config& config);

/// Build cache store and lock for the configured provider
/// Throws std::invalid_argument for an unknown provider
[[nodiscard]] CacheBackends build_cache_backends(const control::CacheConfig& config);

/// Build the response cache engine (nullptr when caching is disabled)
[[nodiscard]] std::shared_ptr<cache::ResponseCacheEngine> build_response_cache(
    const control::CacheConfig& config, const CacheBackends& backends);

/// Build every component and the dispatcher on top of them
/// `invoker` overrides the HTTP backend invoker (tests)
[[nodiscard]] Gateway build_gateway(const control::Config& config,
                                    std::shared_ptr<BackendInvoker> invoker = nullptr);

}  // namespace conduit::gateway
