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

// Conduit Proxy Handler - Implementation

#include "proxy_handler.hpp"

#include <nlohmann/json.hpp>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/regex.hpp"
#include "url_rewriter.hpp"

namespace conduit::gateway {

namespace {

// Request headers the transport sets itself
bool skip_request_header(std::string_view name) {
    return core::iequals(name, "Host") || core::iequals(name, "Connection") ||
           core::iequals(name, "Content-Length") || core::iequals(name, "Content-Type") ||
           core::iequals(name, "Transfer-Encoding") || core::iequals(name, "Keep-Alive") ||
           core::iequals(name, "Upgrade");
}

// Hop-by-hop and length headers are recomputed by the front end
bool skip_response_header(std::string_view name) {
    return core::iequals(name, "Content-Length") || core::iequals(name, "Transfer-Encoding") ||
           core::iequals(name, "Connection") || core::iequals(name, "Keep-Alive");
}

cache::CachedResponse error_response(int status, std::string_view error, std::string_view detail = {}) {
    nlohmann::json body = {{"error", std::string(error)}, {"success", false}};
    if (!detail.empty()) {
        body["detail"] = std::string(detail);
    }
    cache::CachedResponse response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json";
    response.body = body.dump();
    return response;
}

void apply_default_cache_control(cache::CachedResponse& response) {
    if (!response.headers.contains("Cache-Control")) {
        response.headers["Cache-Control"] = std::string(ProxyHandler::DEFAULT_CACHE_CONTROL);
    }
}

}  // namespace

EndpointSegment parse_endpoint_segment(std::string_view segment) {
    static const auto guid_id = http::Regex::compile(R"(^(\w+)\(guid'([\w\-]+)'\)$)");
    static const auto quoted_id = http::Regex::compile(R"(^(\w+)\('([^']+)'\)$)");
    static const auto numeric_id = http::Regex::compile(R"(^(\w+)\((\d+)\)$)");

    for (const auto* pattern : {&guid_id, &quoted_id, &numeric_id}) {
        if (!*pattern) {
            continue;
        }
        auto groups = (*pattern)->extract_groups(segment);
        if (groups.size() == 3) {
            return {std::string(groups[1]), std::string(groups[2])};
        }
    }
    return {std::string(segment), std::nullopt};
}

std::string build_target_url(std::string_view base_url, const std::optional<std::string>& id,
                             std::string_view rest, std::string_view query) {
    std::string url(base_url);
    if (id) {
        url += "(guid'" + *id + "')";
    } else if (!rest.empty()) {
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        url += "/";
        url += rest;
    }
    if (!query.empty()) {
        url += "?";
        url += query;
    }
    return url;
}

bool is_soap_request(const http::HeaderMap& request_headers, std::string_view target_url) {
    auto content_type = http::find_header(request_headers, "Content-Type");
    return core::icontains(content_type, "text/xml") ||
           core::icontains(content_type, "application/soap+xml") ||
           core::icontains(target_url, ".svc") || request_headers.contains("SOAPAction");
}

// ProxyHandler implementation

ProxyHandler::ProxyHandler(std::shared_ptr<BackendInvoker> invoker,
                           std::shared_ptr<EnvironmentRegistry> environments,
                           std::shared_ptr<cache::ResponseCacheEngine> cache,
                           control::BackendConfig backend)
    : invoker_(std::move(invoker)),
      environments_(std::move(environments)),
      cache_(std::move(cache)),
      backend_(std::move(backend)) {}

ProxyResult ProxyHandler::handle(const EndpointDefinition& endpoint, const ProxyRequest& request) const {
    std::string target = build_target_url(endpoint.url, request.endpoint.id, request.rest, request.query);

    if (!http::parse_url(target)) {
        LOG_WARNING(logging::get_logger(), "Blocked unsafe target URL {} for endpoint {}", target,
                    endpoint.name);
        return {error_response(403, "Target URL is not allowed"), std::nullopt};
    }

    bool soap = is_soap_request(request.headers, target);
    auto recompute = [&] { return forward(endpoint, request, target, soap); };

    if (request.method != http::Method::GET || soap || !cache_) {
        if (soap) {
            LOG_DEBUG(logging::get_logger(), "SOAP request for endpoint {}, cache bypassed", endpoint.name);
        }
        ProxyResult uncached{recompute(), std::nullopt};
        if (request.method == http::Method::GET && !soap) {
            apply_default_cache_control(uncached.response);
        }
        return uncached;
    }

    std::string cache_key = cache::build_cache_key({
        request.environment,
        endpoint.name,
        request.rest,
        request.query,
        http::find_header(request.headers, "Authorization"),
        http::find_header(request.headers, "Accept-Language"),
    });

    std::optional<std::chrono::seconds> endpoint_ttl;
    if (endpoint.cache_duration_seconds) {
        endpoint_ttl = std::chrono::seconds(*endpoint.cache_duration_seconds);
    }
    auto result = cache_->handle_cacheable_get(cache_key, cache::lock_key_for(cache_key), endpoint.name,
                                               recompute, endpoint_ttl);
    // Added after the TTL decision so the per-endpoint duration still applies
    apply_default_cache_control(result.response);
    return {std::move(result.response), result.outcome};
}

cache::CachedResponse ProxyHandler::forward(const EndpointDefinition& endpoint, const ProxyRequest& request,
                                            const std::string& target_url, bool soap) const {
    BackendRequest backend;
    backend.url = target_url;
    backend.method = request.method;
    backend.timeout = std::chrono::milliseconds(backend_.timeout_ms);
    backend.cancellation = request.cancellation;

    for (const auto& [name, value] : request.headers) {
        if (skip_request_header(name)) {
            continue;
        }
        if (soap && core::iequals(name, "SOAPAction") && !value.starts_with('"') &&
            !value.ends_with('"')) {
            backend.headers[name] = "\"" + value + "\"";
            continue;
        }
        backend.headers[name] = value;
    }
    if (environments_) {
        for (const auto& [name, value] : environments_->headers_for(request.environment)) {
            backend.headers[name] = value;
        }
    }
    if (!request.correlation_id.empty()) {
        backend.headers["X-Correlation-ID"] = request.correlation_id;
    }

    if (request.method != http::Method::GET && request.method != http::Method::HEAD) {
        backend.body = request.body;
        backend.content_type = std::string(http::find_header(request.headers, "Content-Type"));
    }

    auto* logger = logging::get_logger();
    std::string error;
    auto reply = invoker_->invoke(backend, error);
    if (!reply) {
        LOG_BACKEND(logger, "transport error", http::to_string(request.method), target_url, 0,
                    request.correlation_id);
        if (request.cancellation && request.cancellation->cancelled()) {
            return error_response(503, "Request cancelled");
        }
        return error_response(502, "Backend unavailable", error);
    }
    LOG_BACKEND(logger, "call", http::to_string(request.method), target_url, reply->status_code,
                request.correlation_id);

    cache::CachedResponse response;
    response.status_code = reply->status_code;
    for (const auto& [name, value] : reply->headers) {
        if (!skip_response_header(name)) {
            response.headers[name] = value;
        }
    }
    if (soap) {
        response.body = std::move(reply->body);
        if (!response.headers.contains("Content-Type") &&
            (response.body.find("<soap:Envelope") != std::string::npos ||
             response.body.find("<SOAP-ENV:Envelope") != std::string::npos)) {
            response.headers["Content-Type"] = "text/xml; charset=utf-8";
        }
        return response;
    }

    auto rule = RewriteRule::for_endpoint(endpoint.url, request.public_base, request.environment,
                                          endpoint.name);
    if (!rule) {
        LOG_ERROR(logger, "Cannot build rewrite rule for endpoint {} (url={}, public_base={})",
                  endpoint.name, endpoint.url, request.public_base);
        return error_response(500, "Error processing request");
    }
    response.body = UrlRewriter::rewrite(reply->body, *rule);
    return response;
}

}  // namespace conduit::gateway
