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

// Conduit Pipeline - Implementation

#include "pipeline.hpp"

#include <openssl/crypto.h>

#include <cctype>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

namespace {

constexpr size_t MAX_CORRELATION_ID_LENGTH = 128;

// Accept caller-supplied ids only when they are short and log-safe
bool is_acceptable_correlation_id(std::string_view id) {
    if (id.empty() || id.size() > MAX_CORRELATION_ID_LENGTH) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.' &&
            c != '#') {
            return false;
        }
    }
    return true;
}

}  // namespace

void GatewayResponse::set_error(int status_code, std::string_view message) {
    set_json(status_code, nlohmann::json{{"error", std::string(message)}});
}

// LoggingMiddleware implementation

MiddlewareResult LoggingMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request) {
        return MiddlewareResult::Error;
    }

    auto incoming = http::find_header(ctx.request->headers, "X-Correlation-ID");
    ctx.correlation_id = is_acceptable_correlation_id(incoming) ? std::string(incoming)
                                                                : logging::generate_correlation_id();
    return MiddlewareResult::Continue;
}

MiddlewareResult LoggingMiddleware::process_response(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    if (!ctx.correlation_id.empty()) {
        ctx.response->headers["X-Correlation-ID"] = ctx.correlation_id;
    }

    if (!config_.log_requests) {
        return MiddlewareResult::Continue;
    }
    for (const auto& excluded : config_.exclude_paths) {
        if (ctx.request->path == excluded) {
            return MiddlewareResult::Continue;
        }
    }

    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - ctx.start_time)
                           .count();
    LOG_REQUEST(logging::get_logger(), http::to_string(ctx.request->method), ctx.request->path,
                ctx.response->status, duration_us, ctx.request->client_ip, ctx.correlation_id);
    return MiddlewareResult::Continue;
}

// AuthMiddleware implementation

std::string_view AuthMiddleware::extract_bearer_token(std::string_view header_value) {
    auto value = core::trim(header_value);
    constexpr std::string_view scheme = "bearer";
    if (value.size() <= scheme.size() || !core::iequals(value.substr(0, scheme.size()), scheme) ||
        value[scheme.size()] != ' ') {
        return {};
    }
    return core::trim(value.substr(scheme.size() + 1));
}

bool AuthMiddleware::is_exempt(std::string_view path) const {
    for (const auto& exempt : config_.exempt_paths) {
        if (path == exempt) {
            return true;
        }
    }
    return false;
}

bool AuthMiddleware::is_valid_token(std::string_view token) const {
    bool valid = false;
    for (const auto& candidate : config_.valid_tokens) {
        // Check every token so timing does not reveal which one matched
        if (candidate.size() == token.size() &&
            CRYPTO_memcmp(candidate.data(), token.data(), token.size()) == 0) {
            valid = true;
        }
    }
    return valid;
}

MiddlewareResult AuthMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }
    if (!config_.enabled || is_exempt(ctx.request->path)) {
        return MiddlewareResult::Continue;
    }

    auto token = extract_bearer_token(http::find_header(ctx.request->headers, config_.header));
    if (token.empty()) {
        ctx.response->set_error(401, "Authentication required");
        ctx.response->headers["WWW-Authenticate"] = "Bearer";
        LOG_WARNING(logging::get_logger(), "Missing bearer token: path={}, correlation_id={}",
                    ctx.request->path, ctx.correlation_id);
        return MiddlewareResult::Stop;
    }
    if (!is_valid_token(token)) {
        ctx.response->set_error(403, "Invalid token");
        LOG_WARNING(logging::get_logger(), "Invalid bearer token: path={}, correlation_id={}",
                    ctx.request->path, ctx.correlation_id);
        return MiddlewareResult::Stop;
    }
    return MiddlewareResult::Continue;
}

// SecurityHeadersMiddleware implementation

MiddlewareResult SecurityHeadersMiddleware::process_response(RequestContext& ctx) {
    if (!ctx.response) {
        return MiddlewareResult::Error;
    }
    if (!config_.enabled) {
        return MiddlewareResult::Continue;
    }

    auto& headers = ctx.response->headers;
    headers["X-Content-Type-Options"] = "nosniff";
    headers["X-Frame-Options"] = config_.frame_options;
    headers["Content-Security-Policy"] = config_.content_security_policy;
    headers["Referrer-Policy"] = config_.referrer_policy;
    headers["X-XSS-Protection"] = "1; mode=block";

    // Do not advertise backend software
    headers.erase("Server");
    headers.erase("X-Powered-By");
    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error || ctx.has_error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(RequestContext& ctx) {
    MiddlewareResult overall = MiddlewareResult::Continue;
    for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it) {
        MiddlewareResult result = (*it)->process_response(ctx);
        if (result == MiddlewareResult::Error) {
            overall = MiddlewareResult::Error;
        }
    }
    return overall;
}

}  // namespace conduit::gateway
