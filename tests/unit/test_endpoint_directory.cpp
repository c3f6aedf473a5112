// Conduit Endpoint Directory Unit Tests

#include "../../src/gateway/endpoint_directory.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <thread>

using namespace conduit::gateway;
using namespace conduit::testing;
using Catch::Matchers::ContainsSubstring;
using conduit::http::Method;

namespace {

std::optional<EndpointDefinition> parse(const std::string& json, EndpointType type, std::string& error) {
    return parse_endpoint_definition(nlohmann::ordered_json::parse(json), "Sample", type, error);
}

bool has_message(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ============================================================================
// Definition parsing
// ============================================================================

TEST_CASE("Proxy entity parsing", "[directory]") {
    std::string error;

    SECTION("Full definition") {
        auto def = parse(R"({
            "Url": "http://erp.internal/odata/items",
            "Methods": ["GET", "post"],
            "IsPrivate": true,
            "AllowedEnvironments": ["prod", "Test"],
            "CacheDurationSeconds": 45
        })", EndpointType::Standard, error);
        REQUIRE(def.has_value());
        CHECK(def->type == EndpointType::Standard);
        CHECK(def->url == "http://erp.internal/odata/items");
        CHECK(def->allows_method(Method::GET));
        CHECK(def->allows_method(Method::POST));
        CHECK_FALSE(def->allows_method(Method::DELETE));
        CHECK(def->is_private);
        CHECK(def->allows_environment("test"));
        CHECK_FALSE(def->allows_environment("dev"));
        CHECK(def->cache_duration_seconds == std::optional<uint32_t>(45));
    }

    SECTION("Defaults") {
        auto def = parse(R"({"Url":"http://erp.internal/items"})", EndpointType::Standard, error);
        REQUIRE(def.has_value());
        CHECK(def->methods == std::vector<Method>{Method::GET});
        CHECK_FALSE(def->is_private);
        CHECK(def->allows_environment("anything"));
        CHECK_FALSE(def->cache_duration_seconds.has_value());
    }

    SECTION("Missing Url") {
        CHECK_FALSE(parse(R"({"Methods":["GET"]})", EndpointType::Standard, error));
        CHECK_THAT(error, ContainsSubstring("Url"));
    }

    SECTION("Unknown method") {
        CHECK_FALSE(parse(R"({"Url":"http://x/y","Methods":["FETCH"]})", EndpointType::Standard, error));
        CHECK_THAT(error, ContainsSubstring("FETCH"));
    }

    SECTION("Wrong field type") {
        CHECK_FALSE(parse(R"({"Url":42})", EndpointType::Standard, error));
        CHECK_FALSE(error.empty());
    }

    SECTION("Cache duration must be a non-negative whole number") {
        CHECK_FALSE(parse(R"({"Url":"http://x/y","CacheDurationSeconds":-5})", EndpointType::Standard, error));
        CHECK_THAT(error, ContainsSubstring("CacheDurationSeconds"));
        CHECK_FALSE(parse(R"({"Url":"http://x/y","CacheDurationSeconds":1.5})", EndpointType::Standard, error));
        CHECK_FALSE(parse(R"({"Url":"http://x/y","CacheDurationSeconds":"60"})", EndpointType::Standard, error));
        CHECK_FALSE(
            parse(R"({"Url":"http://x/y","CacheDurationSeconds":99999999999})", EndpointType::Standard, error));

        auto zero = parse(R"({"Url":"http://x/y","CacheDurationSeconds":0})", EndpointType::Standard, error);
        REQUIRE(zero.has_value());
        CHECK(zero->cache_duration_seconds == std::optional<uint32_t>(0));
    }
}

TEST_CASE("Composite entity parsing", "[directory][composite]") {
    std::string error;

    SECTION("Steps keep declaration order and options") {
        auto def = parse(R"({
            "Type": "Composite",
            "CompositeConfig": {
                "Name": "SalesOrder",
                "Description": "Lines then header",
                "Steps": [
                    {"Name": "CreateLines", "Endpoint": "Lines", "IsArray": true, "ArrayProperty": "Lines",
                     "TemplateTransformations": {"TxKey": "$guid", "Source": "portal"}},
                    {"Name": "CreateHeader", "Endpoint": "Header", "Method": "PUT",
                     "DependsOn": "CreateLines", "SourceProperty": "Header"}
                ]
            }
        })", EndpointType::Standard, error);
        REQUIRE(def.has_value());
        CHECK(def->type == EndpointType::Composite);
        CHECK(def->methods == std::vector<Method>{Method::POST});
        REQUIRE(def->composite.has_value());
        CHECK(def->composite->name == "SalesOrder");

        const auto& steps = def->composite->steps;
        REQUIRE(steps.size() == 2);
        CHECK(steps[0].method == Method::POST);
        CHECK(steps[0].is_array);
        CHECK(steps[0].array_property == std::optional<std::string>("Lines"));
        REQUIRE(steps[0].template_transformations.size() == 2);
        CHECK(steps[0].template_transformations[0].first == "TxKey");
        CHECK(steps[0].template_transformations[1].second == "portal");
        CHECK(steps[1].method == Method::PUT);
        CHECK(steps[1].depends_on == std::optional<std::string>("CreateLines"));
        CHECK(steps[1].source_property == std::optional<std::string>("Header"));
    }

    SECTION("Single-entry DependsOn array is accepted") {
        auto def = parse(R"({"CompositeConfig":{"Steps":[
            {"Name":"A","Endpoint":"X"},
            {"Name":"B","Endpoint":"X","DependsOn":["A"]}]}})", EndpointType::Composite, error);
        REQUIRE(def.has_value());
        CHECK(def->composite->steps[1].depends_on == std::optional<std::string>("A"));
    }

    SECTION("Several predecessors are rejected") {
        CHECK_FALSE(parse(R"({"CompositeConfig":{"Steps":[
            {"Name":"A","Endpoint":"X"},{"Name":"B","Endpoint":"X"},
            {"Name":"C","Endpoint":"X","DependsOn":["A","B"]}]}})", EndpointType::Composite, error));
        CHECK_THAT(error, ContainsSubstring("DependsOn"));

        CHECK_FALSE(parse(R"({"CompositeConfig":{"Steps":[
            {"Name":"A","Endpoint":"X"},{"Name":"B","Endpoint":"X"},
            {"Name":"C","Endpoint":"X","DependsOn":"A,B"}]}})", EndpointType::Composite, error));
    }

    SECTION("Missing CompositeConfig or steps") {
        CHECK_FALSE(parse(R"({"Type":"Composite"})", EndpointType::Standard, error));
        CHECK_FALSE(parse(R"({"CompositeConfig":{"Steps":[]}})", EndpointType::Composite, error));
        CHECK_FALSE(parse(R"({"CompositeConfig":{"Steps":[{"Name":"A"}]}})", EndpointType::Composite, error));
    }
}

TEST_CASE("Composite structural validation", "[directory][composite]") {
    CompositeDefinition def;
    def.name = "Check";

    SECTION("Valid chain") {
        CompositeStep b{"B", "X"};
        b.depends_on = "a";  // Case-insensitive
        def.steps = {CompositeStep{"A", "X"}, b};
        CHECK_FALSE(validate_composite(def).has_errors());
    }

    SECTION("Duplicate names") {
        def.steps = {CompositeStep{"A", "X"}, CompositeStep{"a", "Y"}};
        CHECK(has_message(validate_composite(def).errors, "Duplicate"));
    }

    SECTION("Self and unknown dependencies") {
        CompositeStep self{"A", "X"};
        self.depends_on = "A";
        CompositeStep orphan{"B", "X"};
        orphan.depends_on = "Nope";
        def.steps = {self, orphan};
        auto result = validate_composite(def);
        CHECK(has_message(result.errors, "depends on itself"));
        CHECK(has_message(result.errors, "unknown step 'Nope'"));
    }

    SECTION("Cycle") {
        CompositeStep a{"A", "X"};
        a.depends_on = "C";
        CompositeStep b{"B", "X"};
        b.depends_on = "A";
        CompositeStep c{"C", "X"};
        c.depends_on = "B";
        def.steps = {a, b, c};
        CHECK(has_message(validate_composite(def).errors, "cycle"));
    }

    SECTION("Array step without ArrayProperty is a warning") {
        CompositeStep array{"A", "X"};
        array.is_array = true;
        def.steps = {array};
        auto result = validate_composite(def);
        CHECK_FALSE(result.has_errors());
        CHECK(has_message(result.warnings, "ArrayProperty"));
    }
}

// ============================================================================
// Directory
// ============================================================================

TEST_CASE("Directory reload from disk", "[directory]") {
    TempDir dir;
    dir.write("Proxy/Items/entity.json", R"({"Url":"http://erp.internal/items","Methods":["GET"]})");
    dir.write("Proxy/Secret/entity.json", R"({"Url":"http://erp.internal/secret","IsPrivate":true})");
    dir.write("Proxy/Broken/entity.json", "{ not json");
    dir.write("Composite/SalesOrder/entity.json", R"({"CompositeConfig":{"Steps":[
        {"Name":"CreateLines","Endpoint":"Items"},
        {"Name":"Notify","Endpoint":"Mailer"}]}})");
    dir.write("SQL/Reports/entity.json", "{}");
    dir.write("Webhooks/Inbound/entity.json", "{}");

    EndpointDirectory directory(dir.path());
    auto result = directory.reload();

    CHECK(directory.size() == 5);
    CHECK(has_message(result.errors, "Broken"));
    CHECK(has_message(result.warnings, "Mailer"));

    auto items = directory.lookup("items");
    REQUIRE(items);
    CHECK(items->name == "Items");
    CHECK(items->type == EndpointType::Standard);

    auto sales = directory.lookup("SalesOrder");
    REQUIRE(sales);
    CHECK(sales->type == EndpointType::Composite);
    CHECK(sales->methods == std::vector<Method>{Method::POST});

    CHECK(directory.lookup("Reports")->type == EndpointType::Sql);
    CHECK(directory.lookup("Inbound")->type == EndpointType::Webhook);
    CHECK(directory.lookup("Secret")->is_private);
    CHECK(directory.lookup("Broken") == nullptr);

    SECTION("Reload publishes a new snapshot, old readers keep theirs") {
        auto before = directory.snapshot();
        dir.write("Proxy/Orders/entity.json", R"({"Url":"http://erp.internal/orders"})");
        (void)directory.reload();

        CHECK(directory.lookup("Orders") != nullptr);
        CHECK(before->endpoints.size() == 5);
        CHECK(directory.size() == 6);
    }
}

TEST_CASE("Missing endpoints directory", "[directory]") {
    EndpointDirectory directory("/nonexistent/conduit/endpoints");
    auto result = directory.reload();
    CHECK(result.has_errors());
    CHECK(directory.size() == 0);
    CHECK(directory.lookup("Items") == nullptr);
}

TEST_CASE("Directory suggestions", "[directory]") {
    EndpointDirectory directory;
    (void)directory.replace({standard_endpoint("Items", "http://x/items"),
                             standard_endpoint("Orders", "http://x/orders")});

    CHECK(directory.suggest("Itens") == "Items");
    CHECK(directory.suggest("Zzzzzzzz").empty());
}

TEST_CASE("Duplicate and invalid definitions are rejected on replace", "[directory]") {
    EndpointDirectory directory;
    CompositeDefinition loop;
    loop.name = "Loop";
    CompositeStep a{"A", "Items"};
    a.depends_on = "A";
    loop.steps = {a};

    auto result = directory.replace({standard_endpoint("Items", "http://x/items"),
                                     standard_endpoint("ITEMS", "http://x/other"),
                                     composite_endpoint(loop)});

    CHECK(has_message(result.errors, "Duplicate endpoint name"));
    CHECK(has_message(result.errors, "Loop"));
    CHECK(directory.size() == 1);
    CHECK(directory.lookup("items")->url == "http://x/items");
}

TEST_CASE("Lookups during reloads", "[directory][concurrency]") {
    auto directory = std::make_shared<EndpointDirectory>();
    (void)directory->replace({standard_endpoint("Items", "http://x/items")});

    std::atomic<bool> stop{false};
    std::atomic<int> misses{0};
    std::thread reader([&] {
        while (!stop) {
            if (!directory->lookup("Items")) {
                ++misses;
            }
        }
    });

    for (int i = 0; i < 200; ++i) {
        (void)directory->replace({standard_endpoint("Items", "http://x/items/" + std::to_string(i))});
    }
    stop = true;
    reader.join();

    CHECK(misses == 0);
    CHECK(directory->lookup("Items")->url == "http://x/items/199");
}
