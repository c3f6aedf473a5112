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

// Conduit URL Rewriter - Implementation

#include "url_rewriter.hpp"

#include <vector>

#include "../core/logging.hpp"
#include "../http/http.hpp"
#include "../http/regex.hpp"

namespace conduit::gateway {

namespace {

std::string_view trim_slashes(std::string_view s) {
    while (!s.empty() && s.front() == '/') {
        s.remove_prefix(1);
    }
    while (!s.empty() && s.back() == '/') {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view trim_trailing_slash(std::string_view s) {
    while (!s.empty() && s.back() == '/') {
        s.remove_suffix(1);
    }
    return s;
}

// Run one pattern over `content`; false (content untouched) on failure
bool apply(std::string& content, const std::string& pattern, const http::MatchEvaluator& evaluator) {
    std::string error;
    auto regex = http::Regex::compile(pattern, error);
    if (!regex) {
        LOG_ERROR(logging::get_logger(), "URL rewrite pattern failed to compile: {}", error);
        return false;
    }
    auto replaced = regex->replace(content, evaluator);
    if (!replaced) {
        LOG_ERROR(logging::get_logger(), "URL rewrite failed for pattern {}", regex->pattern());
        return false;
    }
    content = std::move(*replaced);
    return true;
}

// All three passes for one spelling of the backend base
bool rewrite_base(std::string& content, std::string_view original_base, const RewriteRule& rule) {
    std::string full_original(original_base);
    if (!rule.original_path.empty()) {
        full_original += "/" + rule.original_path;
    }
    std::string full_new = rule.new_base + rule.new_path;

    // 1. Full backend URL, optionally followed by a sub-path, query, fragment or
    //    OData key ("Items(1)", "Items(guid'...')")
    std::string full_pattern =
        "(\")?(" + http::Regex::escape(full_original) + "([/?#(][^\"\\s]*)?)(\"|[\\s,}])";
    bool ok = apply(content, full_pattern, [&](const std::vector<std::string_view>& g) {
        std::string out;
        out += g[1];
        out += full_new;
        out += g[3];
        out += g[4];
        return out;
    });
    if (!ok || !rule.include_sibling_paths) {
        return ok;
    }

    // 2. Same host, other paths
    std::string prefix = rule.original_path.empty() ? std::string{} : "/" + rule.original_path;
    std::string base_pattern =
        "(\")?(" + http::Regex::escape(original_base) + ")(/[^\"\\s]*)(\"|[\\s,}])";
    ok = apply(content, base_pattern, [&](const std::vector<std::string_view>& g) {
        // "/api2" under a rule for "/api" is a different resource
        if (!prefix.empty() && g[3].substr(0, prefix.size()) == prefix) {
            return std::string(g[0]);
        }
        std::string out;
        out += g[1];
        out += rule.new_base;
        out += rule.new_path;
        out += g[3];
        out += g[4];
        return out;
    });
    return ok;
}

}  // namespace

std::optional<RewriteRule> RewriteRule::for_endpoint(std::string_view backend_url,
                                                     std::string_view public_base,
                                                     std::string_view environment,
                                                     std::string_view endpoint) {
    auto backend = http::parse_url(backend_url);
    auto gateway = http::parse_url(public_base);
    if (!backend || !gateway) {
        return std::nullopt;
    }

    RewriteRule rule;
    rule.original_base = backend->origin();
    rule.original_path = std::string(trim_slashes(backend->path));
    rule.new_base = std::string(trim_trailing_slash(gateway->canonical_origin() + gateway->path));
    rule.new_path = "/api/" + std::string(environment) + "/" + std::string(endpoint);
    return rule;
}

std::string UrlRewriter::rewrite(std::string_view content, const RewriteRule& rule) {
    std::string original(content);
    if (content.empty() || rule.original_base.empty()) {
        return original;
    }

    auto base_url = http::parse_url(rule.original_base);
    if (!base_url) {
        return original;
    }

    std::string result = original;
    if (!rewrite_base(result, base_url->origin(), rule)) {
        return original;
    }
    // Default-port URLs usually appear without the port
    if (base_url->has_default_port() && !rewrite_base(result, base_url->canonical_origin(), rule)) {
        return original;
    }

    // 3. Bare host in quotes
    auto new_url = http::parse_url(rule.new_base);
    if (new_url && !base_url->host.empty()) {
        std::string domain_pattern = "([\"'])(" + http::Regex::escape(base_url->host) + ")([\"'])";
        bool ok = apply(result, domain_pattern, [&](const std::vector<std::string_view>& g) {
            std::string out;
            out += g[1];
            out += new_url->host;
            out += g[3];
            return out;
        });
        if (!ok) {
            return original;
        }
    }

    return result;
}

}  // namespace conduit::gateway
