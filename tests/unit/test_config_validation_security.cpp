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


// Config Validation Security Tests
// Tests for input validation, injection prevention, DoS protection

#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/control/config_validator.hpp"

using namespace conduit::control;

namespace {

Config config_with_environment(const std::string& name) {
    Config config;
    config.environments.allowed = {name};
    return config;
}

Config config_with_duration_key(const std::string& name) {
    Config config;
    config.environments.allowed = {"prod"};
    config.cache.endpoint_durations[name] = 60;
    return config;
}

bool any_error_contains(const ValidationResult& result, std::initializer_list<const char*> needles) {
    for (const auto& error : result.errors) {
        for (const auto* needle : needles) {
            if (error.find(needle) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Path traversal prevention", "[security][config][validation]") {
    SECTION("Rejects .. path traversal") {
        auto result = ConfigValidator::validate(config_with_environment("../etc/passwd"));

        REQUIRE_FALSE(result.valid);
        REQUIRE(any_error_contains(result, {"Path traversal", "Path separators"}));
    }

    SECTION("Rejects embedded ..") {
        REQUIRE_FALSE(ConfigValidator::validate_name_security("prod..backup").empty());
    }

    SECTION("Rejects forward slash") {
        auto result = ConfigValidator::validate(config_with_duration_key("Items/admin"));
        REQUIRE_FALSE(result.valid);
        REQUIRE(any_error_contains(result, {"Path separators"}));
    }

    SECTION("Rejects backslash") {
        auto reason = ConfigValidator::validate_name_security("prod\\..\\secrets");
        REQUIRE_FALSE(reason.empty());
    }

    SECTION("Single dots are allowed") {
        REQUIRE(ConfigValidator::validate_name_security("v1.2").empty());
    }
}

TEST_CASE("Null byte injection prevention", "[security][config][validation]") {
    std::string name("prod");
    name.push_back('\0');
    name += "evil";

    auto reason = ConfigValidator::validate_name_security(name);
    REQUIRE_FALSE(reason.empty());
    REQUIRE(reason.find("Invalid character") != std::string::npos);
    // Non-printable characters are reported escaped
    REQUIRE(reason.find("\\x0") != std::string::npos);
}

TEST_CASE("CRLF injection prevention", "[security][config][validation]") {
    SECTION("Rejects CRLF in environment names") {
        auto result = ConfigValidator::validate(config_with_environment("prod\r\nX-Injected: 1"));
        REQUIRE_FALSE(result.valid);
    }

    SECTION("Rejects bare LF in endpoint keys") {
        auto result = ConfigValidator::validate(config_with_duration_key("Items\nCustomers"));
        REQUIRE_FALSE(result.valid);
    }
}

TEST_CASE("Length limits enforcement", "[security][config][validation][dos]") {
    SECTION("Accepts name at the limit") {
        std::string name(MAX_NAME_LENGTH, 'a');
        REQUIRE(ConfigValidator::validate_name_security(name).empty());
    }

    SECTION("Rejects name over the limit") {
        std::string name(MAX_NAME_LENGTH + 1, 'a');
        auto reason = ConfigValidator::validate_name_security(name);
        REQUIRE(reason.find("Name too long") != std::string::npos);
    }

    SECTION("Rejects empty name") {
        REQUIRE(ConfigValidator::validate_name_security("") == "Name cannot be empty");
    }
}

TEST_CASE("Character whitelist enforcement", "[security][config][validation]") {
    SECTION("Allowed characters") {
        REQUIRE(ConfigValidator::validate_name_security("Sales_Order-v2.1").empty());
        REQUIRE(ConfigValidator::validate_name_security("PROD").empty());
        REQUIRE(ConfigValidator::validate_name_security("0123").empty());
    }

    SECTION("Cache key separators are rejected") {
        // Names become parts of ':' separated cache keys
        REQUIRE_FALSE(ConfigValidator::validate_name_security("prod:Items").empty());
    }

    SECTION("URL and shell metacharacters are rejected") {
        for (const char* name : {"Items?x=1", "Items#frag", "Items%2F", "Items&x", "Items;rm",
                                 "Items|cat", "Items`id`", "$(whoami)", "Items<script>",
                                 "Items'", "Items\"", "Items space"}) {
            INFO(name);
            REQUIRE_FALSE(ConfigValidator::validate_name_security(name).empty());
        }
    }

    SECTION("Non-ASCII is rejected") {
        REQUIRE_FALSE(ConfigValidator::validate_name_security("Prodüction").empty());
    }
}

TEST_CASE("SQL injection pattern prevention", "[security][config][validation]") {
    for (const char* name : {"Items' OR '1'='1", "Items; DROP TABLE users--", "Items/*comment*/"}) {
        INFO(name);
        REQUIRE_FALSE(ConfigValidator::validate_name_security(name).empty());
    }
}

TEST_CASE("Every invalid entry is reported", "[security][config][validation]") {
    Config config;
    config.environments.allowed = {"prod", "../x", "te st"};
    config.cache.endpoint_durations["Items"] = 60;
    config.cache.endpoint_durations["Bad:Key"] = 60;

    auto result = ConfigValidator::validate(config);
    REQUIRE(result.errors.size() == 3);
}
