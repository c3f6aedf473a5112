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

// Conduit Dispatcher - Implementation

#include "dispatcher.hpp"

#include <exception>

#include "../control/config_validator.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

namespace {

constexpr std::string_view API_PREFIX = "api";
constexpr std::string_view COMPOSITE_SEGMENT = "composite";

std::string endpoint_not_found(std::string_view name, const EndpointDirectory& directory) {
    std::string message = "Endpoint '" + std::string(name) + "' not found";
    if (auto suggestion = directory.suggest(name); !suggestion.empty()) {
        message += ". Did you mean: " + suggestion;
    }
    return message;
}

}  // namespace

Dispatcher::Dispatcher(const control::Config& config, DispatcherServices services, Pipeline pipeline)
    : public_base_url_(config.server.public_base_url),
      backend_timeout_(config.backend.timeout_ms),
      services_(std::move(services)),
      pipeline_(std::move(pipeline)) {}

GatewayResponse Dispatcher::handle(GatewayRequest request,
                                   std::shared_ptr<CancellationToken> cancellation) {
    GatewayResponse response;
    RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;
    ctx.cancellation = std::move(cancellation);
    ctx.start_time = std::chrono::steady_clock::now();

    try {
        auto result = pipeline_.execute_request(ctx);
        if (result == MiddlewareResult::Continue) {
            dispatch(ctx);
        } else if (result == MiddlewareResult::Error) {
            LOG_ERROR_CTX(logging::get_logger(), "Middleware error", ctx.correlation_id, 500,
                          ctx.error_message);
            response.set_error(500, "Internal server error");
        }
    } catch (const std::exception& e) {
        LOG_ERROR_CTX(logging::get_logger(), "Unhandled error while dispatching", ctx.correlation_id,
                      500, e.what());
        response = GatewayResponse{};
        response.set_error(500, "Internal server error");
    }

    (void)pipeline_.execute_response(ctx);

    if (services_.metrics) {
        services_.metrics->record_request(
            response.status, std::chrono::duration_cast<std::chrono::microseconds>(
                                 std::chrono::steady_clock::now() - ctx.start_time));
    }
    return response;
}

void Dispatcher::dispatch(RequestContext& ctx) {
    const auto& path = ctx.request->path;

    if (path == "/health/live") {
        handle_health(ctx, true);
        return;
    }
    if (path == "/health") {
        handle_health(ctx, false);
        return;
    }

    auto segments = core::split(path, '/');
    if (segments.size() >= 3 && segments[0] == API_PREFIX) {
        handle_api(ctx, segments);
        return;
    }

    ctx.response->set_error(404, "Not found");
}

void Dispatcher::handle_health(RequestContext& ctx, bool liveness_only) {
    if (liveness_only || !services_.health) {
        ctx.response->set_json(200, nlohmann::json{{"status", "alive"}});
        return;
    }

    control::MetricsSnapshot snapshot;
    if (services_.metrics) {
        snapshot = services_.metrics->snapshot();
    }
    auto health = services_.health->get_server_health(snapshot);
    ctx.response->status = control::HealthResponse::to_http_status(health.status);
    ctx.response->headers["Content-Type"] = "application/json";
    ctx.response->headers["Cache-Control"] = "no-store";
    ctx.response->body = control::HealthResponse::to_json(health);
}

void Dispatcher::handle_api(RequestContext& ctx, const std::vector<std::string_view>& segments) {
    auto* logger = logging::get_logger();
    std::string environment(segments[1]);

    if (auto reason = control::ConfigValidator::validate_name_security(environment); !reason.empty()) {
        ctx.response->set_error(400, "Invalid environment name: " + reason);
        return;
    }
    if (!services_.environments->is_allowed(environment)) {
        LOG_WARNING(logger, "Environment {} rejected: correlation_id={}", environment, ctx.correlation_id);
        ctx.response->set_error(400, "Environment '" + environment + "' is not allowed.");
        return;
    }

    // /api/{env}/composite/{name}
    bool composite_route = core::iequals(segments[2], COMPOSITE_SEGMENT);
    if (composite_route && segments.size() < 4) {
        ctx.response->set_error(404, "Composite endpoint name missing");
        return;
    }

    auto segment = parse_endpoint_segment(composite_route ? segments[3] : segments[2]);
    auto endpoint = services_.directory->lookup(segment.name);
    if (!endpoint || endpoint->is_private) {
        ctx.response->set_error(404, endpoint_not_found(segment.name, *services_.directory));
        return;
    }

    if (composite_route && endpoint->type != EndpointType::Composite) {
        ctx.response->set_error(404, "Composite endpoint '" + segment.name + "' not found");
        return;
    }

    if (!endpoint->allows_environment(environment)) {
        ctx.response->set_error(400, "Environment '" + environment + "' is not allowed for this endpoint.");
        return;
    }

    switch (endpoint->type) {
        case EndpointType::Composite:
            handle_composite(ctx, *endpoint, environment);
            return;

        case EndpointType::Standard: {
            std::vector<std::string> rest_parts;
            for (size_t i = 3; i < segments.size(); ++i) {
                rest_parts.emplace_back(segments[i]);
            }
            handle_proxy(ctx, *endpoint, environment, segment, core::join(rest_parts, "/"));
            return;
        }

        case EndpointType::Sql:
        case EndpointType::Webhook:
        case EndpointType::Files:
            ctx.response->set_error(501, std::string(to_string(endpoint->type)) +
                                             " endpoints are not served by this gateway");
            return;
    }
}

void Dispatcher::handle_composite(RequestContext& ctx, const EndpointDefinition& endpoint,
                                  std::string_view environment) {
    const auto& request = *ctx.request;
    if (request.method != http::Method::POST) {
        ctx.response->set_error(405, "Method not allowed for composite endpoints");
        return;
    }
    if (!endpoint.composite) {
        ctx.response->set_error(500, "Composite endpoint '" + endpoint.name + "' has no definition");
        return;
    }

    RequestMetadata metadata;
    metadata.correlation_id = ctx.correlation_id;
    metadata.public_base = public_base_for(request);
    metadata.timeout = backend_timeout_;
    metadata.cancellation = ctx.cancellation;
    if (auto language = http::find_header(request.headers, "Accept-Language"); !language.empty()) {
        metadata.forward_headers["Accept-Language"] = std::string(language);
    }
    metadata.variables = request.query_params;
    metadata.variables["endpoint"] = endpoint.name;

    auto result = services_.orchestrator->execute(*endpoint.composite, std::string_view(request.body),
                                                  environment, metadata);
    if (services_.metrics) {
        services_.metrics->record_composite(result.success);
    }
    if (!result.success) {
        LOG_WARNING(logging::get_logger(),
                    "Composite {} failed: step={}, error={}, status={}, correlation_id={}",
                    endpoint.name, result.failed_step, to_string(result.error), result.http_status(),
                    ctx.correlation_id);
    }
    ctx.response->set_json(result.http_status(), result.to_json());
}

void Dispatcher::handle_proxy(RequestContext& ctx, const EndpointDefinition& endpoint,
                              std::string_view environment, const EndpointSegment& segment,
                              std::string rest) {
    const auto& request = *ctx.request;
    if (!endpoint.allows_method(request.method)) {
        ctx.response->set_error(405, "Method " + std::string(http::to_string(request.method)) +
                                         " not allowed for endpoint '" + endpoint.name + "'");
        return;
    }

    ProxyRequest proxy_request;
    proxy_request.environment = std::string(environment);
    proxy_request.endpoint = segment;
    proxy_request.rest = std::move(rest);
    proxy_request.query = request.query;
    proxy_request.method = request.method;
    proxy_request.headers = request.headers;
    proxy_request.body = request.body;
    proxy_request.public_base = public_base_for(request);
    proxy_request.correlation_id = ctx.correlation_id;
    proxy_request.cancellation = ctx.cancellation;

    auto result = services_.proxy->handle(endpoint, proxy_request);
    if (services_.metrics) {
        services_.metrics->record_proxy();
    }

    ctx.response->status = result.response.status_code;
    ctx.response->headers = std::move(result.response.headers);
    ctx.response->body = std::move(result.response.body);
    if (result.cache_outcome) {
        ctx.response->headers["X-Cache"] = std::string(cache::to_string(*result.cache_outcome));
    }
}

std::string Dispatcher::public_base_for(const GatewayRequest& request) const {
    if (!public_base_url_.empty()) {
        return public_base_url_;
    }
    auto host = http::find_header(request.headers, "Host");
    if (host.empty()) {
        host = "localhost";
    }
    auto proto = http::find_header(request.headers, "X-Forwarded-Proto");
    std::string scheme = core::iequals(proto, "https") ? "https" : "http";
    return scheme + "://" + std::string(host);
}

}  // namespace conduit::gateway
