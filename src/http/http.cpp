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

// Conduit HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace conduit::http {

namespace {

[[nodiscard]] char lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

bool HeaderNameLess::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](char ca, char cb) { return lower(ca) < lower(cb); });
}

void append_header(HeaderMap& headers, std::string_view name, std::string_view value) {
    auto it = headers.find(name);
    if (it == headers.end()) {
        headers.emplace(std::string(name), std::string(value));
        return;
    }
    it->second += ", ";
    it->second += value;
}

std::string_view find_header(const HeaderMap& headers, std::string_view name) noexcept {
    auto it = headers.find(name);
    return it != headers.end() ? std::string_view(it->second) : std::string_view{};
}

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (header_name_equals(str, "GET"))
        return Method::GET;
    if (header_name_equals(str, "POST"))
        return Method::POST;
    if (header_name_equals(str, "PUT"))
        return Method::PUT;
    if (header_name_equals(str, "DELETE"))
        return Method::DELETE;
    if (header_name_equals(str, "HEAD"))
        return Method::HEAD;
    if (header_name_equals(str, "OPTIONS"))
        return Method::OPTIONS;
    if (header_name_equals(str, "PATCH"))
        return Method::PATCH;
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(),
                      [](char ca, char cb) { return lower(ca) == lower(cb); });
}

std::string media_type(std::string_view content_type) {
    auto semicolon = content_type.find(';');
    std::string_view type = content_type.substr(0, semicolon);

    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front()))) {
        type.remove_prefix(1);
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.remove_suffix(1);
    }

    std::string result(type);
    std::transform(result.begin(), result.end(), result.begin(), lower);
    return result;
}

// Url implementation

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string Url::canonical_origin() const {
    if (has_default_port()) {
        return scheme + "://" + host;
    }
    return origin();
}

std::optional<Url> parse_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    Url result;
    result.scheme = std::string(url.substr(0, scheme_end));
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), lower);
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    size_t authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    // Credentials in the authority are never forwarded
    if (authority.empty() || authority.find('@') != std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view host = authority;
    std::string_view port;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            port = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty() || host == "[]") {
        return std::nullopt;
    }
    result.host = std::string(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(value);
        result.explicit_port = true;
    } else {
        result.port = result.scheme == "https" ? 443 : 80;
    }

    auto fragment = rest.find('#');
    rest = rest.substr(0, fragment);
    auto query = rest.find('?');
    result.path = std::string(rest.substr(0, query));
    if (query != std::string_view::npos) {
        result.query = std::string(rest.substr(query + 1));
    }
    return result;
}

}  // namespace conduit::http
