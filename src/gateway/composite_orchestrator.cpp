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

// Conduit Composite Orchestrator - Implementation

#include "composite_orchestrator.hpp"

#include <algorithm>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "url_rewriter.hpp"

namespace conduit::gateway {

std::string_view to_string(CompositeError error) noexcept {
    switch (error) {
        case CompositeError::None:
            return "None";
        case CompositeError::StepNotFound:
            return "StepNotFound";
        case CompositeError::TemplateReferenceUnresolved:
            return "TemplateReferenceUnresolved";
        case CompositeError::MalformedInputDocument:
            return "MalformedInputDocument";
        case CompositeError::BackendCallFailed:
            return "BackendCallFailed";
        case CompositeError::TransportError:
            return "TransportError";
        case CompositeError::Cancelled:
            return "Cancelled";
        case CompositeError::InvalidDefinition:
            return "InvalidDefinition";
    }
    return "Unknown";
}

// CompositeResult implementation

int CompositeResult::http_status() const noexcept {
    switch (error) {
        case CompositeError::None:
            return 200;
        case CompositeError::StepNotFound:
            return 404;
        case CompositeError::TemplateReferenceUnresolved:
        case CompositeError::MalformedInputDocument:
            return 400;
        case CompositeError::BackendCallFailed:
            return (status_code >= 400 && status_code <= 599) ? status_code : 502;
        case CompositeError::TransportError:
            return 502;
        case CompositeError::Cancelled:
            return 503;
        case CompositeError::InvalidDefinition:
            return 500;
    }
    return 500;
}

nlohmann::ordered_json CompositeResult::to_json() const {
    nlohmann::ordered_json results = nlohmann::ordered_json::object();
    for (const auto& [step, value] : step_results) {
        results[step] = nlohmann::ordered_json::parse(value.dump());
    }

    nlohmann::ordered_json j;
    j["success"] = success;
    if (success) {
        j["results"] = std::move(results);
        return j;
    }

    j["failedStep"] = failed_step;
    j["errorMessage"] = error_message;
    j["errorDetail"] = error_detail;
    j["stepResults"] = std::move(results);
    return j;
}

const nlohmann::json* CompositeResult::result_of(std::string_view step) const {
    for (const auto& [name, value] : step_results) {
        if (name == step) {
            return &value;
        }
    }
    return nullptr;
}

std::string extract_error_detail(std::string_view body, std::optional<nlohmann::json>& structured) {
    structured.reset();

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        structured = parsed;

        static constexpr std::string_view paths[] = {"error.message.value", "error.message",
                                                     "message", "error", "detail", "title"};
        for (auto path : paths) {
            const auto* value = find_path(parsed, path);
            if (value && value->is_string()) {
                return value->get<std::string>();
            }
        }
    }

    if (body.size() > CompositeOrchestrator::MAX_ERROR_DETAIL_BYTES) {
        return std::string(body.substr(0, CompositeOrchestrator::MAX_ERROR_DETAIL_BYTES)) + "...";
    }
    return std::string(body);
}

// CompositeOrchestrator implementation

namespace {

void fail(CompositeResult& result, const CompositeStep& step, CompositeError error,
          std::string message) {
    result.success = false;
    result.failed_step = step.name;
    result.error = error;
    result.error_message = std::move(message);
    result.status_code = result.http_status();
}

nlohmann::json parse_backend_body(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return body;
    }
    return parsed;
}

}  // namespace

CompositeOrchestrator::CompositeOrchestrator(std::shared_ptr<EndpointDirectory> directory,
                                             std::shared_ptr<BackendInvoker> invoker,
                                             std::shared_ptr<EnvironmentRegistry> environments,
                                             TemplateResolver resolver)
    : directory_(std::move(directory)),
      invoker_(std::move(invoker)),
      environments_(std::move(environments)),
      resolver_(std::move(resolver)) {}

CompositeResult CompositeOrchestrator::execute(const CompositeDefinition& definition,
                                               std::string_view request_body,
                                               std::string_view environment,
                                               const RequestMetadata& metadata) const {
    auto parsed = request_body.empty() ? nlohmann::json::object()
                                       : nlohmann::json::parse(request_body, nullptr, false);
    if (parsed.is_discarded()) {
        CompositeResult result;
        result.error = CompositeError::MalformedInputDocument;
        result.error_message = "Request body is not valid JSON";
        result.status_code = result.http_status();
        return result;
    }
    return execute(definition, std::move(parsed), environment, metadata);
}

CompositeResult CompositeOrchestrator::execute(const CompositeDefinition& definition,
                                               nlohmann::json request_body,
                                               std::string_view environment,
                                               const RequestMetadata& metadata) const {
    auto* logger = logging::get_logger();
    CompositeResult result;

    if (auto check = validate_composite(definition); check.has_errors()) {
        result.error = CompositeError::InvalidDefinition;
        result.error_message = "Composite '" + definition.name + "' is invalid: " +
                               core::join(check.errors, "; ");
        result.status_code = result.http_status();
        return result;
    }

    ExecutionContext context;
    context.root = std::move(request_body);
    context.variables = metadata.variables;
    context.variables["environment"] = std::string(environment);
    context.variables["correlation_id"] = metadata.correlation_id;

    LOG_INFO(logger, "Composite {} started: steps={}, environment={}, correlation_id={}",
             definition.name, definition.steps.size(), environment, metadata.correlation_id);

    std::vector<bool> done(definition.steps.size(), false);
    size_t completed = 0;

    while (completed < definition.steps.size()) {
        // First eligible step in document order
        const CompositeStep* next = nullptr;
        size_t next_index = 0;
        for (size_t i = 0; i < definition.steps.size(); ++i) {
            const auto& step = definition.steps[i];
            if (done[i]) {
                continue;
            }
            if (!step.depends_on || context.step_result(*step.depends_on) != nullptr) {
                next = &step;
                next_index = i;
                break;
            }
        }
        if (!next) {
            break;  // Unreachable after validation
        }

        if (metadata.cancellation && metadata.cancellation->cancelled()) {
            fail(result, *next, CompositeError::Cancelled, "Request cancelled before step '" +
                                                               next->name + "'");
            break;
        }

        if (!run_step(*next, context, environment, metadata, result)) {
            LOG_ERROR_CTX(logger, "Composite step failed", metadata.correlation_id,
                          to_string(result.error), result.error_message);
            break;
        }

        done[next_index] = true;
        ++completed;
    }

    result.step_results = std::move(context.step_results);
    result.success = result.error == CompositeError::None;
    if (result.success) {
        result.status_code = 200;
    }

    rewrite_results(result, environment, metadata);

    LOG_INFO(logger, "Composite {} finished: success={}, steps_completed={}, correlation_id={}",
             definition.name, result.success, result.step_results.size(), metadata.correlation_id);
    return result;
}

bool CompositeOrchestrator::run_step(const CompositeStep& step, ExecutionContext& context,
                                     std::string_view environment, const RequestMetadata& metadata,
                                     CompositeResult& result) const {
    auto target = directory_->lookup(step.endpoint);
    if (!target || target->type != EndpointType::Standard) {
        std::string message = "Endpoint '" + step.endpoint + "' for step '" + step.name + "' not found";
        if (auto suggestion = directory_->suggest(step.endpoint); !suggestion.empty()) {
            message += ". Did you mean: " + suggestion;
        }
        fail(result, step, CompositeError::StepNotFound, std::move(message));
        return false;
    }

    // Input document
    const nlohmann::json* input = &context.root;
    if (step.source_property) {
        input = find_path(context.root, *step.source_property);
        for (auto it = context.step_results.rbegin(); !input && it != context.step_results.rend(); ++it) {
            input = find_path(it->second, *step.source_property);
        }
        if (!input) {
            fail(result, step, CompositeError::MalformedInputDocument,
                 "Source property '" + *step.source_property + "' not found for step '" + step.name + "'");
            return false;
        }
    }

    std::vector<nlohmann::json> elements;
    if (step.is_array) {
        const nlohmann::json* array = input;
        if (step.array_property) {
            array = find_path(*input, *step.array_property);
        }
        if (!array || !array->is_array()) {
            fail(result, step, CompositeError::MalformedInputDocument,
                 "Array property '" + step.array_property.value_or("") + "' for step '" + step.name +
                     "' is missing or not an array");
            return false;
        }
        elements.assign(array->begin(), array->end());
    } else {
        elements.push_back(*input);
    }

    nlohmann::json outputs = nlohmann::json::array();
    for (auto& element : elements) {
        if (!step.template_transformations.empty()) {
            if (element.is_null()) {
                element = nlohmann::json::object();
            }
            if (!element.is_object()) {
                fail(result, step, CompositeError::MalformedInputDocument,
                     "Input for step '" + step.name + "' is not an object");
                return false;
            }
        }

        for (const auto& [field, expression] : step.template_transformations) {
            std::string error;
            auto value = resolver_.resolve(expression, context, error);
            if (!value) {
                fail(result, step, CompositeError::TemplateReferenceUnresolved, error);
                return false;
            }
            element[field] = std::move(*value);
        }

        if (metadata.cancellation && metadata.cancellation->cancelled()) {
            fail(result, step, CompositeError::Cancelled, "Request cancelled during step '" + step.name + "'");
            return false;
        }

        nlohmann::json output;
        if (!invoke_element(step, *target, element, environment, metadata, output, result)) {
            return false;
        }
        outputs.push_back(std::move(output));
    }

    context.add_step_result(step.name, step.is_array ? std::move(outputs) : std::move(outputs[0]));
    return true;
}

bool CompositeOrchestrator::invoke_element(const CompositeStep& step, const EndpointDefinition& target,
                                           const nlohmann::json& element, std::string_view environment,
                                           const RequestMetadata& metadata, nlohmann::json& output,
                                           CompositeResult& result) const {
    if (!http::parse_url(target.url)) {
        fail(result, step, CompositeError::BackendCallFailed,
             "Target URL for endpoint '" + target.name + "' is not allowed");
        result.status_code = 403;
        return false;
    }

    BackendRequest request;
    request.url = target.url;
    request.method = step.method;
    if (environments_) {
        request.headers = environments_->headers_for(environment);
    }
    for (const auto& [name, value] : metadata.forward_headers) {
        request.headers[name] = value;
    }
    if (!metadata.correlation_id.empty()) {
        request.headers["X-Correlation-ID"] = metadata.correlation_id;
    }
    request.headers["Accept"] = "application/json";
    request.body = element.dump();
    request.content_type = "application/json";
    request.timeout = metadata.timeout;
    request.cancellation = metadata.cancellation;

    auto* logger = logging::get_logger();
    std::string error;
    auto response = invoker_->invoke(request, error);
    if (!response) {
        if (metadata.cancellation && metadata.cancellation->cancelled()) {
            fail(result, step, CompositeError::Cancelled, "Request cancelled during step '" + step.name + "'");
            return false;
        }
        LOG_BACKEND(logger, "transport error", http::to_string(step.method), target.url, 0,
                    metadata.correlation_id);
        fail(result, step, CompositeError::TransportError,
             "Step '" + step.name + "' could not reach endpoint '" + target.name + "'");
        result.status_code = 0;
        result.error_detail = error;
        return false;
    }

    LOG_BACKEND(logger, "call", http::to_string(step.method), target.url, response->status_code,
                metadata.correlation_id);

    if (!http::is_success(response->status_code)) {
        fail(result, step, CompositeError::BackendCallFailed,
             "Step '" + step.name + "' failed with status " + std::to_string(response->status_code));
        result.status_code = response->status_code;
        result.response_body = response->body;
        result.error_detail = extract_error_detail(response->body, result.structured_error);
        return false;
    }

    output = parse_backend_body(response->body);
    return true;
}

void CompositeOrchestrator::rewrite_results(CompositeResult& result, std::string_view environment,
                                            const RequestMetadata& metadata) const {
    if (metadata.public_base.empty() || result.step_results.empty()) {
        return;
    }

    std::vector<RewriteRule> rules;
    auto snapshot = directory_->snapshot();
    for (const auto& [key, def] : snapshot->endpoints) {
        if (def->type != EndpointType::Standard || def->url.empty()) {
            continue;
        }
        if (auto rule = RewriteRule::for_endpoint(def->url, metadata.public_base, environment, def->name)) {
            rule->include_sibling_paths = false;
            rules.push_back(std::move(*rule));
        }
    }

    // Most specific backend path first
    std::stable_sort(rules.begin(), rules.end(), [](const RewriteRule& a, const RewriteRule& b) {
        return a.original_path.size() > b.original_path.size();
    });

    for (auto& [step, value] : result.step_results) {
        std::string text = value.dump();
        std::string rewritten = text;
        for (const auto& rule : rules) {
            rewritten = UrlRewriter::rewrite(rewritten, rule);
        }
        if (rewritten == text) {
            continue;
        }
        auto parsed = nlohmann::json::parse(rewritten, nullptr, false);
        if (parsed.is_discarded()) {
            LOG_WARNING(logging::get_logger(), "Rewritten result of step {} is not valid JSON, kept original",
                        step);
            continue;
        }
        value = std::move(parsed);
    }
}

}  // namespace conduit::gateway
