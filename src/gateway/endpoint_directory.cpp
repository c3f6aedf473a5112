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

// Conduit Endpoint Directory - Implementation

#include "endpoint_directory.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

#include "../control/config_validator.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace conduit::gateway {

namespace fs = std::filesystem;

std::string_view to_string(EndpointType type) noexcept {
    switch (type) {
        case EndpointType::Standard:
            return "Standard";
        case EndpointType::Composite:
            return "Composite";
        case EndpointType::Sql:
            return "SQL";
        case EndpointType::Webhook:
            return "Webhook";
        case EndpointType::Files:
            return "Files";
    }
    return "Unknown";
}

bool EndpointDefinition::allows_method(http::Method method) const noexcept {
    for (auto m : methods) {
        if (m == method) {
            return true;
        }
    }
    return false;
}

bool EndpointDefinition::allows_environment(std::string_view environment) const noexcept {
    if (allowed_environments.empty()) {
        return true;
    }
    for (const auto& env : allowed_environments) {
        if (core::iequals(env, environment)) {
            return true;
        }
    }
    return false;
}

namespace {

std::optional<std::string> optional_string(const nlohmann::ordered_json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    auto value = j.at(key).get<std::string>();
    if (core::trim(value).empty()) {
        return std::nullopt;
    }
    return std::string(core::trim(value));
}

// DependsOn is a single step name; arrays are accepted only with one entry
bool parse_depends_on(const nlohmann::ordered_json& step, std::optional<std::string>& out,
                      std::string& error) {
    if (!step.contains("DependsOn") || step.at("DependsOn").is_null()) {
        return true;
    }

    const auto& value = step.at("DependsOn");
    std::string name;
    if (value.is_array()) {
        if (value.size() > 1) {
            error = "DependsOn lists " + std::to_string(value.size()) +
                    " steps; only a single predecessor is supported";
            return false;
        }
        if (value.empty()) {
            return true;
        }
        name = value.at(0).get<std::string>();
    } else {
        name = value.get<std::string>();
    }

    if (name.find(',') != std::string::npos) {
        error = "DependsOn '" + name + "' names several steps; only a single predecessor is supported";
        return false;
    }

    auto trimmed = core::trim(name);
    if (!trimmed.empty()) {
        out = std::string(trimmed);
    }
    return true;
}

std::optional<CompositeStep> parse_step(const nlohmann::ordered_json& j, size_t index,
                                        std::string& error) {
    if (!j.is_object()) {
        error = "Step " + std::to_string(index) + " is not an object";
        return std::nullopt;
    }

    CompositeStep step;
    step.name = j.value("Name", "");
    step.endpoint = j.value("Endpoint", "");
    if (step.name.empty() || step.endpoint.empty()) {
        error = "Step " + std::to_string(index) + " requires Name and Endpoint";
        return std::nullopt;
    }

    auto method_name = j.value("Method", "POST");
    step.method = http::parse_method(method_name);
    if (step.method == http::Method::UNKNOWN) {
        error = "Step '" + step.name + "' has unknown method '" + method_name + "'";
        return std::nullopt;
    }

    if (!parse_depends_on(j, step.depends_on, error)) {
        error = "Step '" + step.name + "': " + error;
        return std::nullopt;
    }

    step.is_array = j.value("IsArray", false);
    step.array_property = optional_string(j, "ArrayProperty");
    step.source_property = optional_string(j, "SourceProperty");

    if (j.contains("TemplateTransformations") && !j.at("TemplateTransformations").is_null()) {
        const auto& transforms = j.at("TemplateTransformations");
        if (!transforms.is_object()) {
            error = "Step '" + step.name + "': TemplateTransformations must be an object";
            return std::nullopt;
        }
        for (const auto& [field, expression] : transforms.items()) {
            if (!expression.is_string()) {
                error = "Step '" + step.name + "': transformation for '" + field +
                        "' must be a string";
                return std::nullopt;
            }
            step.template_transformations.emplace_back(field, expression.get<std::string>());
        }
    }

    return step;
}

EndpointType parse_type(std::string_view type, EndpointType fallback) {
    if (core::iequals(type, "composite")) {
        return EndpointType::Composite;
    }
    if (core::iequals(type, "standard")) {
        return EndpointType::Standard;
    }
    if (core::iequals(type, "sql")) {
        return EndpointType::Sql;
    }
    if (core::iequals(type, "webhook")) {
        return EndpointType::Webhook;
    }
    if (core::iequals(type, "files")) {
        return EndpointType::Files;
    }
    return fallback;
}

std::optional<nlohmann::ordered_json> read_entity(const fs::path& file, std::string& error) {
    std::ifstream in{file};
    if (!in.is_open()) {
        error = "Cannot open " + file.string();
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return nlohmann::ordered_json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        error = file.string() + ": " + e.what();
        return std::nullopt;
    }
}

}  // namespace

std::optional<EndpointDefinition> parse_endpoint_definition(const nlohmann::ordered_json& entity,
                                                            std::string_view name,
                                                            EndpointType default_type,
                                                            std::string& error) {
    if (!entity.is_object()) {
        error = "Endpoint definition must be a JSON object";
        return std::nullopt;
    }

    try {
        EndpointDefinition def;
        def.name = std::string(name);
        def.type = parse_type(entity.value("Type", ""), default_type);
        def.url = entity.value("Url", "");
        def.is_private = entity.value("IsPrivate", false);

        if (entity.contains("Methods") && entity.at("Methods").is_array()) {
            for (const auto& m : entity.at("Methods")) {
                auto method = http::parse_method(m.get<std::string>());
                if (method == http::Method::UNKNOWN) {
                    error = "Unknown method '" + m.get<std::string>() + "'";
                    return std::nullopt;
                }
                def.methods.push_back(method);
            }
        }
        if (def.methods.empty()) {
            def.methods.push_back(def.type == EndpointType::Composite ? http::Method::POST
                                                                      : http::Method::GET);
        }

        if (entity.contains("AllowedEnvironments") && entity.at("AllowedEnvironments").is_array()) {
            def.allowed_environments = entity.at("AllowedEnvironments").get<std::vector<std::string>>();
        }

        if (entity.contains("CacheDurationSeconds") && !entity.at("CacheDurationSeconds").is_null()) {
            const auto& duration = entity.at("CacheDurationSeconds");
            if (!duration.is_number_integer() || duration.get<int64_t>() < 0 ||
                duration.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
                error = "CacheDurationSeconds must be a non-negative whole number of seconds";
                return std::nullopt;
            }
            def.cache_duration_seconds = static_cast<uint32_t>(duration.get<int64_t>());
        }

        if (def.type == EndpointType::Composite) {
            if (!entity.contains("CompositeConfig") || !entity.at("CompositeConfig").is_object()) {
                error = "Composite endpoint requires CompositeConfig";
                return std::nullopt;
            }
            const auto& cfg = entity.at("CompositeConfig");
            CompositeDefinition composite;
            composite.name = cfg.value("Name", def.name);
            composite.description = cfg.value("Description", "");

            if (!cfg.contains("Steps") || !cfg.at("Steps").is_array() || cfg.at("Steps").empty()) {
                error = "CompositeConfig requires at least one step";
                return std::nullopt;
            }
            size_t index = 0;
            for (const auto& s : cfg.at("Steps")) {
                auto step = parse_step(s, index++, error);
                if (!step) {
                    return std::nullopt;
                }
                composite.steps.push_back(std::move(*step));
            }
            def.composite = std::move(composite);
        } else if (def.type == EndpointType::Standard && def.url.empty()) {
            error = "Proxy endpoint requires Url";
            return std::nullopt;
        }

        return def;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

control::ValidationResult validate_composite(const CompositeDefinition& composite) {
    control::ValidationResult result;

    core::fast_map<std::string, const CompositeStep*> by_name;
    for (const auto& step : composite.steps) {
        auto key = core::to_lower(step.name);
        if (!by_name.emplace(key, &step).second) {
            result.add_error("Duplicate step name '" + step.name + "'");
        }
    }

    for (const auto& step : composite.steps) {
        if (step.is_array && !step.array_property) {
            result.add_warning("Step '" + step.name +
                               "' is an array step without ArrayProperty; its input must be an array");
        }
        if (!step.depends_on) {
            continue;
        }
        if (core::iequals(*step.depends_on, step.name)) {
            result.add_error("Step '" + step.name + "' depends on itself");
            continue;
        }
        if (!by_name.contains(core::to_lower(*step.depends_on))) {
            result.add_error("Step '" + step.name + "' depends on unknown step '" +
                             *step.depends_on + "'");
        }
    }

    if (result.has_errors()) {
        return result;
    }

    // Single predecessor per step: a cycle shows up as a chain longer than the step count
    for (const auto& step : composite.steps) {
        const CompositeStep* current = &step;
        size_t hops = 0;
        while (current->depends_on && hops <= composite.steps.size()) {
            current = by_name.at(core::to_lower(*current->depends_on));
            ++hops;
        }
        if (hops > composite.steps.size()) {
            result.add_error("Dependency cycle involving step '" + step.name + "'");
            break;
        }
    }

    return result;
}

// EndpointDirectory implementation

EndpointDirectory::EndpointDirectory(std::string directory)
    : directory_(std::move(directory)), snapshot_(std::make_shared<const DirectorySnapshot>()) {}

control::ValidationResult EndpointDirectory::reload() {
    control::ValidationResult result;
    std::vector<EndpointDefinition> definitions;

    struct Source {
        const char* folder;
        EndpointType type;
        bool requires_entity;
    };
    static constexpr Source sources[] = {
        {"Proxy", EndpointType::Standard, true},   {"Composite", EndpointType::Composite, true},
        {"SQL", EndpointType::Sql, false},         {"Webhooks", EndpointType::Webhook, false},
        {"Files", EndpointType::Files, false},
    };

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        result.add_error("Endpoints directory not found: " + directory_);
        return result;
    }

    for (const auto& source : sources) {
        fs::path root = fs::path(directory_) / source.folder;
        if (!fs::is_directory(root, ec)) {
            continue;
        }

        for (const auto& item : fs::directory_iterator(root, ec)) {
            if (!item.is_directory(ec)) {
                continue;
            }
            std::string name = item.path().filename().string();
            if (auto reason = control::ConfigValidator::validate_name_security(name); !reason.empty()) {
                result.add_error(std::string(source.folder) + "/" + name + ": " + reason);
                continue;
            }

            fs::path entity_file = item.path() / "entity.json";
            if (!source.requires_entity) {
                EndpointDefinition def;
                def.name = name;
                def.type = source.type;
                def.methods = {http::Method::GET, http::Method::POST};
                definitions.push_back(std::move(def));
                continue;
            }

            std::string error;
            auto entity = read_entity(entity_file, error);
            if (!entity) {
                result.add_error(error);
                continue;
            }
            auto def = parse_endpoint_definition(*entity, name, source.type, error);
            if (!def) {
                result.add_error(std::string(source.folder) + "/" + name + ": " + error);
                continue;
            }
            definitions.push_back(std::move(*def));
        }
    }

    auto published = replace(std::move(definitions));
    result.merge(published);
    return result;
}

control::ValidationResult EndpointDirectory::replace(std::vector<EndpointDefinition> definitions) {
    control::ValidationResult result;
    auto next = std::make_shared<DirectorySnapshot>();

    for (auto& def : definitions) {
        if (def.composite) {
            auto check = validate_composite(*def.composite);
            if (check.has_errors()) {
                for (const auto& e : check.errors) {
                    result.add_error("Composite '" + def.name + "' rejected: " + e);
                }
                continue;
            }
            for (const auto& w : check.warnings) {
                result.add_warning("Composite '" + def.name + "': " + w);
            }
        }

        auto key = core::to_lower(def.name);
        if (next->endpoints.contains(key)) {
            result.add_error("Duplicate endpoint name '" + def.name + "'");
            continue;
        }
        next->names.push_back(def.name);
        next->endpoints.emplace(std::move(key),
                                std::make_shared<const EndpointDefinition>(std::move(def)));
    }

    // Steps may target endpoints defined later in the load, so check after the full pass
    for (const auto& [key, def] : next->endpoints) {
        if (!def->composite) {
            continue;
        }
        for (const auto& step : def->composite->steps) {
            if (!next->endpoints.contains(core::to_lower(step.endpoint))) {
                result.add_warning("Composite '" + def->name + "' step '" + step.name +
                                   "' targets unknown endpoint '" + step.endpoint + "'");
            }
        }
    }

    auto* logger = logging::get_logger();
    for (const auto& e : result.errors) {
        LOG_ERROR(logger, "Endpoint definition error: {}", e);
    }
    for (const auto& w : result.warnings) {
        LOG_WARNING(logger, "Endpoint definition warning: {}", w);
    }

    {
        std::lock_guard lock(reload_mutex_);
        std::atomic_store(&snapshot_, std::shared_ptr<const DirectorySnapshot>(std::move(next)));
    }
    LOG_INFO(logger, "Endpoint directory loaded: {} endpoints", size());
    return result;
}

std::shared_ptr<const EndpointDefinition> EndpointDirectory::lookup(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->endpoints.find(core::to_lower(name));
    if (it == snap->endpoints.end()) {
        return nullptr;
    }
    return it->second;
}

std::string EndpointDirectory::suggest(std::string_view name) const {
    return control::ConfigValidator::suggest_similar(std::string(name), names());
}

std::shared_ptr<const DirectorySnapshot> EndpointDirectory::snapshot() const {
    return std::atomic_load(&snapshot_);
}

std::vector<std::string> EndpointDirectory::names() const {
    return snapshot()->names;
}

size_t EndpointDirectory::size() const {
    return snapshot()->names.size();
}

}  // namespace conduit::gateway
