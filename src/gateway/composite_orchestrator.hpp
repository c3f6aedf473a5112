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

// Conduit Composite Orchestrator - Header
// Runs multi-step composite workflows against backend endpoints

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "backend_invoker.hpp"
#include "endpoint_directory.hpp"
#include "environment.hpp"
#include "template_resolver.hpp"

namespace conduit::gateway {

/// Why a composite request stopped
enum class CompositeError : uint8_t {
    None,
    StepNotFound,                 // Target endpoint unknown
    TemplateReferenceUnresolved,  // $prev / $context reference missing
    MalformedInputDocument,       // Body not JSON, or source/array property missing
    BackendCallFailed,            // Backend answered with a non-2xx status
    TransportError,               // No response from the backend
    Cancelled,                    // Request cancelled between steps
    InvalidDefinition             // Workflow failed structural validation
};

[[nodiscard]] std::string_view to_string(CompositeError error) noexcept;

/// Outcome of one composite execution
struct CompositeResult {
    bool success = false;
    std::vector<std::pair<std::string, nlohmann::json>> step_results;  // Executed prefix

    // Failure details
    std::string failed_step;
    CompositeError error = CompositeError::None;
    std::string error_message;
    std::string error_detail;
    int status_code = 200;       // Backend status for BackendCallFailed, 0 for transport errors
    std::string response_body;   // Raw backend error body
    std::optional<nlohmann::json> structured_error;

    /// HTTP status the dispatcher answers with
    [[nodiscard]] int http_status() const noexcept;

    /// Response document: {"success":true,"results":{...}} or the failure shape
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    [[nodiscard]] const nlohmann::json* result_of(std::string_view step) const;
};

/// Per-request inputs besides the body
struct RequestMetadata {
    std::string correlation_id;
    std::string public_base;                     // Gateway origin used when rewriting results
    http::HeaderMap forward_headers;             // Sent with every step call
    std::map<std::string, std::string> variables;  // Extra $context variables
    std::chrono::milliseconds timeout{30000};
    std::shared_ptr<CancellationToken> cancellation;
};

/// Backend error detail: message from a JSON error body, else the raw body (truncated)
[[nodiscard]] std::string extract_error_detail(std::string_view body,
                                               std::optional<nlohmann::json>& structured);

/// Sequential workflow executor
/// Steps run one at a time in dependency order (document order among eligible steps).
/// The first failure stops the workflow; completed steps are not rolled back.
class CompositeOrchestrator {
public:
    static constexpr size_t MAX_ERROR_DETAIL_BYTES = 2000;

    CompositeOrchestrator(std::shared_ptr<EndpointDirectory> directory,
                          std::shared_ptr<BackendInvoker> invoker,
                          std::shared_ptr<EnvironmentRegistry> environments = nullptr,
                          TemplateResolver resolver = TemplateResolver{});

    /// Parse the body and execute
    [[nodiscard]] CompositeResult execute(const CompositeDefinition& definition,
                                          std::string_view request_body,
                                          std::string_view environment,
                                          const RequestMetadata& metadata) const;

    /// Execute against an already parsed body
    [[nodiscard]] CompositeResult execute(const CompositeDefinition& definition,
                                          nlohmann::json request_body,
                                          std::string_view environment,
                                          const RequestMetadata& metadata) const;

private:
    /// Run one step; returns false (with `result` filled in) on failure
    bool run_step(const CompositeStep& step, ExecutionContext& context, std::string_view environment,
                  const RequestMetadata& metadata, CompositeResult& result) const;

    /// Invoke the target for one element; false on failure
    bool invoke_element(const CompositeStep& step, const EndpointDefinition& target,
                        const nlohmann::json& element, std::string_view environment,
                        const RequestMetadata& metadata, nlohmann::json& output,
                        CompositeResult& result) const;

    /// Map backend URLs in completed results to public gateway URLs
    void rewrite_results(CompositeResult& result, std::string_view environment,
                         const RequestMetadata& metadata) const;

    std::shared_ptr<EndpointDirectory> directory_;
    std::shared_ptr<BackendInvoker> invoker_;
    std::shared_ptr<EnvironmentRegistry> environments_;
    TemplateResolver resolver_;
};

}  // namespace conduit::gateway
