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

// Conduit URL Rewriter - Header
// Replaces backend URLs in response bodies with the gateway's public URLs

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace conduit::gateway {

/// One backend location and its public replacement
struct RewriteRule {
    std::string original_base;  // scheme://host:port
    std::string original_path;  // Backend path, no leading or trailing '/'
    std::string new_base;       // Public scheme://host[:port]
    std::string new_path;       // Public path, e.g. "/api/prod/Items"

    // Also map other paths on the backend host onto new_path. Disable when several
    // rules share a host, otherwise the first rule claims every path.
    bool include_sibling_paths = true;

    /// Rule for an endpoint URL published as {public_base}/api/{environment}/{endpoint}.
    /// nullopt when either URL is not an absolute http(s) URL.
    [[nodiscard]] static std::optional<RewriteRule> for_endpoint(std::string_view backend_url,
                                                                 std::string_view public_base,
                                                                 std::string_view environment,
                                                                 std::string_view endpoint);
};

/// Textual rewrite over serialized content.
/// The backend URL may be followed by '/', '?', '#' or an OData key '(' and must end at
/// a quote, whitespace, ',' or '}', so a longer path that merely starts with the backend
/// path is left alone.
class UrlRewriter {
public:
    /// Returns the content unchanged when nothing matches or a pattern fails
    [[nodiscard]] static std::string rewrite(std::string_view content, const RewriteRule& rule);
};

}  // namespace conduit::gateway
