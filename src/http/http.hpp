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

// Conduit HTTP Protocol - Header
// HTTP value types shared by the dispatcher, the engines and the backend invoker

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::http {

/// HTTP methods
enum class Method : uint8_t { GET, POST, PUT, DELETE, HEAD, OPTIONS, PATCH, UNKNOWN };

/// HTTP status codes
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    TooManyRequests = 429,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// Case-insensitive ordering for header names (transparent, accepts string_view lookups)
struct HeaderNameLess {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept;
};

/// Header collection keyed by case-insensitive name.
/// Repeated headers are folded into one comma separated value.
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

/// Add a header, folding into an existing value with ", " when present
void append_header(HeaderMap& headers, std::string_view name, std::string_view value);

/// Look up a header value, empty view when absent
[[nodiscard]] std::string_view find_header(const HeaderMap& headers,
                                           std::string_view name) noexcept;

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method (case-insensitive)
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Media type without parameters, lower-cased ("Application/JSON; charset=utf-8" -> "application/json")
[[nodiscard]] std::string media_type(std::string_view content_type);

/// 2xx status check
[[nodiscard]] constexpr bool is_success(int status) noexcept {
    return status >= 200 && status < 300;
}

/// Absolute http(s) URL split into its parts
struct Url {
    std::string scheme;  // "http" or "https", lower-cased
    std::string host;
    uint16_t port = 0;   // Explicit or scheme default
    bool explicit_port = false;
    std::string path;    // Leading '/' included, empty when the URL has none
    std::string query;   // Without '?'

    /// scheme://host:port (port always present)
    [[nodiscard]] std::string origin() const;

    /// scheme://host, or scheme://host:port when the port is not the scheme default
    [[nodiscard]] std::string canonical_origin() const;

    [[nodiscard]] bool has_default_port() const noexcept {
        return (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
    }
};

/// Parse an absolute http/https URL with a non-empty host; nullopt for anything else
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

}  // namespace conduit::http
