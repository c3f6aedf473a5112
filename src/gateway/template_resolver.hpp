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

// Conduit Template Resolver - Header
// Per-request execution state for composite workflows and the template expression DSL

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace conduit::gateway {

/// State of one composite execution. Owned by a single request, never shared.
struct ExecutionContext {
    nlohmann::json root;                                   // Parsed request body
    std::map<std::string, nlohmann::json> shared_values;   // Expression text -> resolved value
    std::vector<std::pair<std::string, nlohmann::json>> step_results;  // Completion order
    std::map<std::string, std::string> variables;          // $context.<name>

    /// Result of a completed step (case-insensitive name), nullptr when it has not run
    [[nodiscard]] const nlohmann::json* step_result(std::string_view step) const;

    void add_step_result(std::string step, nlohmann::json result);
};

/// Walk a dotted path ("items.0.id"); numeric segments index arrays.
/// Object keys match exactly first, then case-insensitively. Empty path is the document.
[[nodiscard]] const nlohmann::json* find_path(const nlohmann::json& document, std::string_view path);

/// Resolves template expressions:
///   $guid              one generated id per request (memoised by expression text)
///   $prev.<step>.<path> value from a completed step's result
///   $context.<name>    execution variable
///   anything else      literal string
class TemplateResolver {
public:
    using IdGenerator = std::function<std::string()>;

    TemplateResolver();
    explicit TemplateResolver(IdGenerator generator);

    /// nullopt with `error` when a reference cannot be resolved
    [[nodiscard]] std::optional<nlohmann::json> resolve(std::string_view expression,
                                                        ExecutionContext& context,
                                                        std::string& error) const;

private:
    IdGenerator generator_;
};

}  // namespace conduit::gateway
