// Conduit Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/logging.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

using namespace conduit::logging;

namespace {

// Lower-case 8-4-4-4-12 hex, version 4, RFC 4122 variant
bool looks_like_uuid_v4(std::string_view s) {
    if (s.size() != 36 || s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return false;
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        bool hex = (s[i] >= '0' && s[i] <= '9') || (s[i] >= 'a' && s[i] <= 'f');
        if (!hex) {
            return false;
        }
    }
    return s[14] == '4' && std::string_view("89ab").find(s[19]) != std::string_view::npos;
}

std::pair<std::string, std::string> split_correlation_id(const std::string& id) {
    auto pos = id.find('#');
    REQUIRE(pos != std::string::npos);
    return {id.substr(0, pos), id.substr(pos + 1)};
}

}  // namespace

TEST_CASE("Correlation ids share a per-thread base and count up", "[logging][correlation_id]") {
    auto [base1, counter1] = split_correlation_id(generate_correlation_id());
    auto [base2, counter2] = split_correlation_id(generate_correlation_id());

    CHECK(looks_like_uuid_v4(base1));
    CHECK(base1 == base2);
    REQUIRE_FALSE(counter1.empty());
    CHECK(std::all_of(counter1.begin(), counter1.end(), [](char c) { return c >= '0' && c <= '9'; }));
    CHECK(std::stoull(counter2) == std::stoull(counter1) + 1);

    SECTION("Another thread gets its own base") {
        std::string other;
        std::thread([&other] { other = generate_correlation_id(); }).join();
        auto [other_base, other_counter] = split_correlation_id(other);
        CHECK(looks_like_uuid_v4(other_base));
        CHECK(other_base != base1);
        CHECK(other_counter == "0");
    }
}

TEST_CASE("Random UUIDs", "[logging][uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto uuid = generate_uuid();
        REQUIRE(looks_like_uuid_v4(uuid));
        seen.insert(uuid);
    }
    CHECK(seen.size() == 200);
}

TEST_CASE("Process logger", "[logging][logger]") {
    auto* logger = get_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_logger() == logger);

    // Structured macros format without throwing
    LOG_REQUEST(logger, "GET", "/api/prod/Items", 200, 1234, "10.0.0.1", "corr-1");
    LOG_ERROR_CTX(logger, "Backend failed", "corr-1", 502, "connection refused");
    LOG_BACKEND(logger, "call", "POST", "http://erp.internal/lines", 201, "corr-1");
}
