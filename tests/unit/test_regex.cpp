// Conduit Regex Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/http/regex.hpp"

using namespace conduit::http;

TEST_CASE("Regex compilation", "[regex]") {
    SECTION("Valid pattern") {
        auto regex = Regex::compile("^/api/([a-z]+)$");
        REQUIRE(regex.has_value());
        REQUIRE(regex->pattern() == "^/api/([a-z]+)$");
    }

    SECTION("Invalid pattern reports an error") {
        std::string error;
        auto regex = Regex::compile("(unclosed", error);
        REQUIRE_FALSE(regex.has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Move keeps the compiled code") {
        auto regex = Regex::compile("a+");
        REQUIRE(regex.has_value());
        Regex moved = std::move(*regex);
        REQUIRE(moved.matches("caaat"));
    }
}

TEST_CASE("Matching and groups", "[regex]") {
    auto regex = Regex::compile("(\\w+)@(\\w+)(\\.org)?");
    REQUIRE(regex.has_value());

    REQUIRE(regex->matches("mail alice@example now"));
    REQUIRE_FALSE(regex->matches("no address"));
    REQUIRE(regex->find_first("to: bob@corp.") == "bob@corp");

    auto groups = regex->extract_groups("alice@example");
    REQUIRE(groups.size() == 4);
    REQUIRE(groups[0] == "alice@example");
    REQUIRE(groups[1] == "alice");
    REQUIRE(groups[2] == "example");
    REQUIRE(groups[3].empty());  // Unmatched optional group

    REQUIRE(regex->extract_groups("nothing here").empty());
}

TEST_CASE("Escaping literals", "[regex]") {
    std::string literal = "http://erp.internal:8080/odata(v4)?$top=5";
    auto regex = Regex::compile("^" + Regex::escape(literal) + "$");
    REQUIRE(regex.has_value());
    REQUIRE(regex->matches(literal));
    REQUIRE_FALSE(regex->matches("http://erpXinternal:8080/odata(v4)?$top=5"));
}

TEST_CASE("Replace with evaluator", "[regex]") {
    SECTION("Every occurrence") {
        auto regex = Regex::compile("item-(\\d+)");
        REQUIRE(regex.has_value());
        auto replaced = regex->replace("item-1, item-22 and item-333",
                                       [](const std::vector<std::string_view>& g) {
                                           return "#" + std::string(g[1]);
                                       });
        REQUIRE(replaced == std::optional<std::string>("#1, #22 and #333"));
    }

    SECTION("No match returns the input") {
        auto regex = Regex::compile("zzz");
        REQUIRE(regex.has_value());
        auto replaced = regex->replace("abc", [](const auto&) { return std::string("x"); });
        REQUIRE(replaced == std::optional<std::string>("abc"));
    }

    SECTION("Empty matches make progress") {
        auto regex = Regex::compile("x*");
        REQUIRE(regex.has_value());
        auto replaced = regex->replace("ab", [](const auto&) { return std::string("-"); });
        REQUIRE(replaced == std::optional<std::string>("-a-b-"));
    }
}
