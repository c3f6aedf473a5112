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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include <stdexcept>

#include "../cache/redis_store.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

Pipeline build_pipeline(const control::Config& config) {
    PipelineBuilder builder;

    // Logging first: correlation id is assigned before anything can stop the chain
    builder.use(std::make_unique<LoggingMiddleware>(config.logging));

    // Response phase runs in reverse, so security headers land on auth rejections too
    if (config.security_headers.enabled) {
        builder.use(std::make_unique<SecurityHeadersMiddleware>(config.security_headers));
    }

    if (config.auth.enabled) {
        builder.use(std::make_unique<AuthMiddleware>(config.auth));
    }

    return std::move(builder).build();
}

CacheBackends build_cache_backends(const control::CacheConfig& config) {
    CacheBackends backends;
    auto provider = core::to_lower(config.provider);

    if (provider == "memory") {
        backends.store = std::make_shared<cache::MemoryCacheStore>(config.max_entries);
        backends.lock = std::make_shared<cache::MemoryLock>();
    } else if (provider == "redis") {
        backends.redis = std::make_shared<core::RedisClient>(config.redis);
        backends.store = std::make_shared<cache::RedisCacheStore>(backends.redis);
        backends.lock = std::make_shared<cache::RedisLock>(backends.redis);
    } else {
        throw std::invalid_argument("Unknown cache provider: " + config.provider);
    }

    return backends;
}

std::shared_ptr<cache::ResponseCacheEngine> build_response_cache(const control::CacheConfig& config,
                                                                 const CacheBackends& backends) {
    if (!config.enabled || !backends.store || !backends.lock) {
        return nullptr;
    }
    return std::make_shared<cache::ResponseCacheEngine>(backends.store, backends.lock,
                                                        cache::CachePolicy::from_config(config));
}

Gateway build_gateway(const control::Config& config, std::shared_ptr<BackendInvoker> invoker) {
    auto* logger = logging::get_logger();
    Gateway gateway;

    if (!invoker) {
        invoker = std::make_shared<HttpBackendInvoker>(config.backend);
    }

    auto& services = gateway.services;
    services.directory = std::make_shared<EndpointDirectory>(config.endpoints.directory);
    services.environments = std::make_shared<EnvironmentRegistry>(config.environments);
    services.orchestrator =
        std::make_shared<CompositeOrchestrator>(services.directory, invoker, services.environments);
    services.metrics = std::make_shared<control::GatewayMetrics>();
    services.health = std::make_shared<control::HealthChecker>(config.version);

    std::shared_ptr<cache::ResponseCacheEngine> response_cache;
    if (config.cache.enabled) {
        auto backends = build_cache_backends(config.cache);
        gateway.redis = backends.redis;
        response_cache = build_response_cache(config.cache, backends);
        LOG_INFO(logger, "Response cache enabled: store={}, lock={}", response_cache->store_name(),
                 response_cache->lock_name());
    } else {
        LOG_INFO(logger, "Response cache disabled");
    }
    services.proxy = std::make_shared<ProxyHandler>(invoker, services.environments, response_cache,
                                                    config.backend);

    // Health probes
    std::weak_ptr<EndpointDirectory> weak_directory = services.directory;
    services.health->add_probe([weak_directory]() {
        control::ComponentHealth component{"endpoints", control::HealthStatus::Healthy, {}};
        auto directory = weak_directory.lock();
        size_t count = directory ? directory->size() : 0;
        component.detail = std::to_string(count) + " endpoints loaded";
        if (count == 0) {
            component.status = control::HealthStatus::Degraded;
        }
        return component;
    });

    if (gateway.redis) {
        std::weak_ptr<core::RedisClient> weak_redis = gateway.redis;
        services.health->add_probe([weak_redis]() {
            control::ComponentHealth component{"redis", control::HealthStatus::Healthy, "PONG"};
            auto redis = weak_redis.lock();
            std::string error;
            if (!redis) {
                component.status = control::HealthStatus::Unhealthy;
                component.detail = "not configured";
            } else if (!redis->ping(error)) {
                // Cache degrades to uncached serving, the gateway stays up
                component.status = control::HealthStatus::Degraded;
                component.detail = error;
            }
            return component;
        });
    }

    gateway.dispatcher =
        std::make_unique<Dispatcher>(config, gateway.services, build_pipeline(config));
    return gateway;
}

}  // namespace conduit::gateway
