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

// Conduit Dispatcher - Header
// Routes /api/{env}/... requests to the proxy and composite engines

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../control/health.hpp"
#include "../control/metrics.hpp"
#include "composite_orchestrator.hpp"
#include "endpoint_directory.hpp"
#include "environment.hpp"
#include "pipeline.hpp"
#include "proxy_handler.hpp"

namespace conduit::gateway {

/// Collaborators of the dispatcher
struct DispatcherServices {
    std::shared_ptr<EndpointDirectory> directory;
    std::shared_ptr<EnvironmentRegistry> environments;
    std::shared_ptr<CompositeOrchestrator> orchestrator;
    std::shared_ptr<ProxyHandler> proxy;
    std::shared_ptr<control::GatewayMetrics> metrics;
    std::shared_ptr<control::HealthChecker> health;
};

/// Front door of the gateway
/// handle() runs the middleware pipeline, routes, and records metrics.
class Dispatcher {
public:
    Dispatcher(const control::Config& config, DispatcherServices services, Pipeline pipeline);

    // Non-copyable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Full request lifecycle. Never throws.
    [[nodiscard]] GatewayResponse handle(GatewayRequest request,
                                         std::shared_ptr<CancellationToken> cancellation = nullptr);

    /// Routing only (middleware already applied)
    void dispatch(RequestContext& ctx);

    [[nodiscard]] const DispatcherServices& services() const noexcept { return services_; }

private:
    void handle_health(RequestContext& ctx, bool liveness_only);
    void handle_api(RequestContext& ctx, const std::vector<std::string_view>& segments);
    void handle_composite(RequestContext& ctx, const EndpointDefinition& endpoint,
                          std::string_view environment);
    void handle_proxy(RequestContext& ctx, const EndpointDefinition& endpoint,
                      std::string_view environment, const EndpointSegment& segment,
                      std::string rest);

    /// Configured public base, else scheme://Host of the request
    [[nodiscard]] std::string public_base_for(const GatewayRequest& request) const;

    std::string public_base_url_;
    std::chrono::milliseconds backend_timeout_;
    DispatcherServices services_;
    Pipeline pipeline_;
};

}  // namespace conduit::gateway
