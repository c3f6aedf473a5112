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

// Conduit Pipeline - Header
// Middleware chain around the dispatcher

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "backend_invoker.hpp"

namespace conduit::gateway {

/// Inbound request, independent of the wire server
struct GatewayRequest {
    http::Method method = http::Method::GET;
    std::string path;   // Decoded path
    std::string query;  // Raw query string without '?'
    std::map<std::string, std::string> query_params;
    http::HeaderMap headers;
    std::string body;
    std::string client_ip;
};

struct GatewayResponse {
    int status = 200;
    http::HeaderMap headers;
    std::string body;

    /// Replace body with a JSON document
    template <typename Json>
    void set_json(int status_code, const Json& document) {
        status = status_code;
        headers["Content-Type"] = "application/json";
        body = document.dump();
    }

    /// {"error": message}
    void set_error(int status_code, std::string_view message);
};

/// Request context (passed through the middleware chain and the dispatcher)
struct RequestContext {
    GatewayRequest* request = nullptr;
    GatewayResponse* response = nullptr;

    std::string correlation_id;
    std::shared_ptr<CancellationToken> cancellation;

    // Timing
    std::chrono::steady_clock::time_point start_time;

    // Error handling
    bool has_error = false;
    std::string error_message;

    /// Helper: Set error
    void set_error(std::string message) {
        has_error = true;
        error_message = std::move(message);
    }
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (response already written)
    Error      // Error occurred
};

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before dispatch)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (runs even when the request phase stopped early)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_response(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Correlation id assignment (request) and access logging (response)
class LoggingMiddleware : public Middleware {
public:
    LoggingMiddleware() = default;
    explicit LoggingMiddleware(control::LogConfig config) : config_(std::move(config)) {}

    MiddlewareResult process_request(RequestContext& ctx) override;
    MiddlewareResult process_response(RequestContext& ctx) override;
    std::string_view name() const override { return "LoggingMiddleware"; }

private:
    control::LogConfig config_;
};

/// Bearer token authentication: 401 without a token, 403 for an unknown one
class AuthMiddleware : public Middleware {
public:
    explicit AuthMiddleware(control::AuthConfig config) : config_(std::move(config)) {}

    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "AuthMiddleware"; }

    /// Token from "Bearer <token>" (scheme case-insensitive); empty when absent
    [[nodiscard]] static std::string_view extract_bearer_token(std::string_view header_value);

private:
    [[nodiscard]] bool is_exempt(std::string_view path) const;
    [[nodiscard]] bool is_valid_token(std::string_view token) const;

    control::AuthConfig config_;
};

/// Hardening headers on every response
class SecurityHeadersMiddleware : public Middleware {
public:
    SecurityHeadersMiddleware() = default;
    explicit SecurityHeadersMiddleware(control::SecurityHeadersConfig config)
        : config_(std::move(config)) {}

    MiddlewareResult process_response(RequestContext& ctx) override;
    std::string_view name() const override { return "SecurityHeadersMiddleware"; }

private:
    control::SecurityHeadersConfig config_;
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Execute request phase (before dispatch)
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute response phase, in reverse registration order
    [[nodiscard]] MiddlewareResult execute_response(RequestContext& ctx);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(std::unique_ptr<Middleware> middleware) {
        pipeline_.use(std::move(middleware));
        return *this;
    }

    Pipeline build() && { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

}  // namespace conduit::gateway
