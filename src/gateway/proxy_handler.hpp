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

// Conduit Proxy Handler - Header
// Single-endpoint proxying: target URL construction, header forwarding, body rewriting, caching

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../cache/response_cache.hpp"
#include "../control/config.hpp"
#include "backend_invoker.hpp"
#include "endpoint_directory.hpp"
#include "environment.hpp"

namespace conduit::gateway {

/// Endpoint path segment, optionally carrying an entity id: Name(guid'..'), Name('..'), Name(123)
struct EndpointSegment {
    std::string name;
    std::optional<std::string> id;
};

[[nodiscard]] EndpointSegment parse_endpoint_segment(std::string_view segment);

/// base + "(guid'{id}')" when an id is present, else base + "/" + rest; then "?" + query
[[nodiscard]] std::string build_target_url(std::string_view base_url,
                                           const std::optional<std::string>& id,
                                           std::string_view rest, std::string_view query);

/// SOAP is detected by request content type, SOAPAction header or a .svc target
[[nodiscard]] bool is_soap_request(const http::HeaderMap& request_headers, std::string_view target_url);

/// Inbound request as seen by the proxy
struct ProxyRequest {
    std::string environment;
    EndpointSegment endpoint;
    std::string rest;              // Path after the endpoint segment, no leading '/'
    std::string query;             // Raw query string without '?'
    http::Method method = http::Method::GET;
    http::HeaderMap headers;
    std::string body;
    std::string public_base;       // Gateway origin for rewriting, e.g. "https://api.example.com"
    std::string correlation_id;
    std::shared_ptr<CancellationToken> cancellation;
};

struct ProxyResult {
    cache::CachedResponse response;
    std::optional<cache::CacheOutcome> cache_outcome;  // Set when the cache engine served it
};

class ProxyHandler {
public:
    static constexpr std::string_view DEFAULT_CACHE_CONTROL = "public, max-age=300";

    /// `cache` may be null (caching disabled)
    ProxyHandler(std::shared_ptr<BackendInvoker> invoker,
                 std::shared_ptr<EnvironmentRegistry> environments,
                 std::shared_ptr<cache::ResponseCacheEngine> cache, control::BackendConfig backend);

    [[nodiscard]] ProxyResult handle(const EndpointDefinition& endpoint, const ProxyRequest& request) const;

private:
    /// Call the backend and shape the response (headers, rewrite)
    [[nodiscard]] cache::CachedResponse forward(const EndpointDefinition& endpoint,
                                                const ProxyRequest& request,
                                                const std::string& target_url, bool soap) const;

    std::shared_ptr<BackendInvoker> invoker_;
    std::shared_ptr<EnvironmentRegistry> environments_;
    std::shared_ptr<cache::ResponseCacheEngine> cache_;
    control::BackendConfig backend_;
};

}  // namespace conduit::gateway
