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

// Conduit Template Resolver - Implementation

#include "template_resolver.hpp"

#include <charconv>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

namespace {

constexpr std::string_view GUID_EXPRESSION = "$guid";
constexpr std::string_view PREV_PREFIX = "$prev.";
constexpr std::string_view CONTEXT_PREFIX = "$context.";

bool parse_index(std::string_view segment, size_t& index) {
    if (segment.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    return ec == std::errc() && ptr == segment.data() + segment.size();
}

}  // namespace

const nlohmann::json* ExecutionContext::step_result(std::string_view step) const {
    for (const auto& [name, result] : step_results) {
        if (core::iequals(name, step)) {
            return &result;
        }
    }
    return nullptr;
}

void ExecutionContext::add_step_result(std::string step, nlohmann::json result) {
    step_results.emplace_back(std::move(step), std::move(result));
}

const nlohmann::json* find_path(const nlohmann::json& document, std::string_view path) {
    const nlohmann::json* current = &document;

    for (auto segment : core::split(path, '.')) {
        if (current->is_array()) {
            size_t index = 0;
            if (!parse_index(segment, index) || index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
            continue;
        }

        if (!current->is_object()) {
            return nullptr;
        }

        std::string key(segment);
        auto it = current->find(key);
        if (it != current->end()) {
            current = &*it;
            continue;
        }

        const nlohmann::json* match = nullptr;
        for (auto candidate = current->begin(); candidate != current->end(); ++candidate) {
            if (core::iequals(candidate.key(), segment)) {
                match = &*candidate;
                break;
            }
        }
        if (!match) {
            return nullptr;
        }
        current = match;
    }

    return current;
}

// TemplateResolver implementation

TemplateResolver::TemplateResolver() : generator_(logging::generate_uuid) {}

TemplateResolver::TemplateResolver(IdGenerator generator) : generator_(std::move(generator)) {}

std::optional<nlohmann::json> TemplateResolver::resolve(std::string_view expression,
                                                        ExecutionContext& context,
                                                        std::string& error) const {
    if (expression == GUID_EXPRESSION) {
        std::string key(expression);
        auto it = context.shared_values.find(key);
        if (it != context.shared_values.end()) {
            return it->second;
        }
        nlohmann::json value = generator_();
        context.shared_values.emplace(std::move(key), value);
        return value;
    }

    if (expression.starts_with(PREV_PREFIX)) {
        std::string_view reference = expression.substr(PREV_PREFIX.size());
        auto dot = reference.find('.');
        std::string_view step = reference.substr(0, dot);
        std::string_view path = dot == std::string_view::npos ? std::string_view{}
                                                              : reference.substr(dot + 1);

        const auto* result = context.step_result(step);
        if (!result) {
            error = "Reference '" + std::string(expression) + "' names step '" + std::string(step) +
                    "' which has not completed";
            return std::nullopt;
        }
        const auto* value = find_path(*result, path);
        if (!value) {
            error = "Reference '" + std::string(expression) + "' does not exist in the result of step '" +
                    std::string(step) + "'";
            return std::nullopt;
        }
        return *value;
    }

    if (expression.starts_with(CONTEXT_PREFIX)) {
        std::string name(expression.substr(CONTEXT_PREFIX.size()));
        auto it = context.variables.find(name);
        if (it == context.variables.end()) {
            error = "Context variable '" + name + "' is not set";
            return std::nullopt;
        }
        return nlohmann::json(it->second);
    }

    return nlohmann::json(std::string(expression));
}

}  // namespace conduit::gateway
