// Conduit Composite Orchestrator Unit Tests

#include "../../src/gateway/composite_orchestrator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <set>

using namespace conduit::gateway;
using namespace conduit::testing;
using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace {

struct CompositeFixture {
    std::shared_ptr<EndpointDirectory> directory = std::make_shared<EndpointDirectory>();
    std::shared_ptr<FakeInvoker> invoker = std::make_shared<FakeInvoker>();

    void publish(std::vector<EndpointDefinition> definitions) {
        auto result = directory->replace(std::move(definitions));
        REQUIRE_FALSE(result.has_errors());
    }

    CompositeOrchestrator orchestrator(TemplateResolver resolver = TemplateResolver{}) {
        return CompositeOrchestrator(directory, invoker, nullptr, std::move(resolver));
    }

    static RequestMetadata metadata() {
        RequestMetadata md;
        md.correlation_id = "test-correlation";
        return md;
    }
};

// Deterministic ids: id-1, id-2, ...
TemplateResolver counting_resolver(std::shared_ptr<std::atomic<int>> counter) {
    return TemplateResolver([counter] { return "id-" + std::to_string(++*counter); });
}

const char* SALES_ORDER = R"({
    "Type": "Composite",
    "CompositeConfig": {
        "Name": "SalesOrder",
        "Steps": [
            {
                "Name": "CreateLines",
                "Endpoint": "Lines",
                "Method": "POST",
                "IsArray": true,
                "ArrayProperty": "Lines",
                "TemplateTransformations": { "TxKey": "$guid" }
            },
            {
                "Name": "CreateHeader",
                "Endpoint": "Header",
                "Method": "POST",
                "DependsOn": "CreateLines",
                "SourceProperty": "Header",
                "TemplateTransformations": { "TxKey": "$prev.CreateLines.0.TxKey" }
            }
        ]
    }
})";

}  // namespace

// ============================================================================
// Sales order workflow
// ============================================================================

TEST_CASE("Sales order creates every line then the header", "[composite][scenario]") {
    CompositeFixture f;
    f.publish({standard_endpoint("Lines", "http://erp.internal/api/lines"),
               standard_endpoint("Header", "http://erp.internal/api/header")});
    f.invoker->echo("http://erp.internal/api/lines");
    f.invoker->echo("http://erp.internal/api/header");

    auto counter = std::make_shared<std::atomic<int>>(0);
    auto orchestrator = f.orchestrator(counting_resolver(counter));
    auto definition = parse_composite("SalesOrder", SALES_ORDER);

    auto body = R"({
        "Lines": [ {"Item": "A", "Qty": 1}, {"Item": "B", "Qty": 2}, {"Item": "C", "Qty": 3} ],
        "Header": {"Customer": "ACME"}
    })";
    auto result = orchestrator.execute(definition, std::string_view(body), "prod", f.metadata());

    REQUIRE(result.success);
    REQUIRE(result.http_status() == 200);

    auto calls = f.invoker->calls();
    REQUIRE(calls.size() == 4);

    SECTION("One call per line, all before the header") {
        for (size_t i = 0; i < 3; ++i) {
            CHECK(calls[i].url == "http://erp.internal/api/lines");
            CHECK(calls[i].method == conduit::http::Method::POST);
        }
        CHECK(calls[3].url == "http://erp.internal/api/header");
    }

    SECTION("Lines share the request's generated key") {
        std::set<std::string> keys;
        for (size_t i = 0; i < 3; ++i) {
            auto sent = json::parse(calls[i].body);
            keys.insert(sent["TxKey"].get<std::string>());
        }
        CHECK(keys.size() == 1);
        CHECK(*keys.begin() == "id-1");
        CHECK(*counter == 1);
    }

    SECTION("Line bodies keep their own fields") {
        auto first = json::parse(calls[0].body);
        auto third = json::parse(calls[2].body);
        CHECK(first["Item"] == "A");
        CHECK(third["Qty"] == 3);
    }

    SECTION("Header carries the first line's key") {
        auto header = json::parse(calls[3].body);
        CHECK(header["TxKey"] == "id-1");
        CHECK(header["Customer"] == "ACME");
        CHECK_FALSE(header.contains("Lines"));
    }

    SECTION("Results are keyed by step name") {
        const auto* lines = result.result_of("CreateLines");
        REQUIRE(lines != nullptr);
        REQUIRE(lines->is_array());
        CHECK(lines->size() == 3);

        auto doc = result.to_json();
        CHECK(doc["success"] == true);
        CHECK(doc["results"].contains("CreateLines"));
        CHECK(doc["results"].contains("CreateHeader"));
    }
}

TEST_CASE("$guid differs between executions", "[composite][template]") {
    CompositeFixture f;
    f.publish({standard_endpoint("Lines", "http://erp.internal/api/lines"),
               standard_endpoint("Header", "http://erp.internal/api/header")});
    f.invoker->echo("http://erp.internal/");

    auto orchestrator = f.orchestrator();
    auto definition = parse_composite("SalesOrder", SALES_ORDER);
    auto body = R"({"Lines":[{"Item":"A"}],"Header":{}})";

    auto first = orchestrator.execute(definition, std::string_view(body), "prod", f.metadata());
    auto second = orchestrator.execute(definition, std::string_view(body), "prod", f.metadata());
    REQUIRE(first.success);
    REQUIRE(second.success);

    auto key_of = [](const CompositeResult& r) {
        return (*r.result_of("CreateHeader"))["TxKey"].get<std::string>();
    };
    CHECK(key_of(first) != key_of(second));
    CHECK(key_of(first).size() == 36);
}

// ============================================================================
// Ordering and fail-fast
// ============================================================================

TEST_CASE("Dependent step waits for its predecessor", "[composite][ordering]") {
    CompositeFixture f;
    f.publish({standard_endpoint("A", "http://svc.internal/a"),
               standard_endpoint("B", "http://svc.internal/b")});
    f.invoker->respond("http://svc.internal/a", 200, R"({"id":7})");
    f.invoker->echo("http://svc.internal/b");

    // B is listed first but depends on A
    CompositeDefinition definition;
    definition.name = "Ordered";
    CompositeStep b{"StepB", "B"};
    b.depends_on = "StepA";
    b.template_transformations = {{"parent", "$prev.StepA.id"}};
    definition.steps.push_back(b);
    definition.steps.push_back(CompositeStep{"StepA", "A"});

    auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());
    REQUIRE(result.success);

    auto calls = f.invoker->calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].url == "http://svc.internal/a");
    CHECK(calls[1].url == "http://svc.internal/b");
    CHECK(json::parse(calls[1].body)["parent"] == 7);

    REQUIRE(result.step_results.size() == 2);
    CHECK(result.step_results[0].first == "StepA");
    CHECK(result.step_results[1].first == "StepB");
}

TEST_CASE("Failure in the middle stops the workflow", "[composite][failfast]") {
    CompositeFixture f;
    f.publish({standard_endpoint("One", "http://svc.internal/one"),
               standard_endpoint("Two", "http://svc.internal/two"),
               standard_endpoint("Three", "http://svc.internal/three")});
    f.invoker->respond("http://svc.internal/one", 200, R"({"ok":1})");
    f.invoker->respond("http://svc.internal/two", 422,
                       R"({"error":{"message":{"value":"Quantity must be positive"}}})");
    f.invoker->respond("http://svc.internal/three", 200, R"({"ok":3})");

    CompositeDefinition definition;
    definition.name = "ThreeSteps";
    definition.steps.push_back(CompositeStep{"Step1", "One"});
    CompositeStep two{"Step2", "Two"};
    two.depends_on = "Step1";
    definition.steps.push_back(two);
    CompositeStep three{"Step3", "Three"};
    three.depends_on = "Step2";
    definition.steps.push_back(three);

    auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());

    REQUIRE_FALSE(result.success);
    CHECK(result.failed_step == "Step2");
    CHECK(result.error == CompositeError::BackendCallFailed);
    CHECK(result.status_code == 422);
    CHECK(result.http_status() == 422);
    CHECK(result.error_detail == "Quantity must be positive");
    REQUIRE(result.structured_error.has_value());

    REQUIRE(result.step_results.size() == 1);
    CHECK(result.step_results[0].first == "Step1");
    CHECK(f.invoker->call_count("http://svc.internal/three") == 0);

    auto doc = result.to_json();
    CHECK(doc["success"] == false);
    CHECK(doc["failedStep"] == "Step2");
    CHECK(doc["stepResults"].size() == 1);
    CHECK(doc["stepResults"].contains("Step1"));
    CHECK_FALSE(doc["stepResults"].contains("Step3"));
}

TEST_CASE("Unresolved $prev path fails the step before calling it", "[composite][template]") {
    CompositeFixture f;
    f.publish({standard_endpoint("A", "http://svc.internal/a"),
               standard_endpoint("B", "http://svc.internal/b"),
               standard_endpoint("C", "http://svc.internal/c")});
    f.invoker->respond("http://svc.internal/a", 200, R"({"items":[]})");
    f.invoker->echo("http://svc.internal/b");
    f.invoker->echo("http://svc.internal/c");

    CompositeDefinition definition;
    definition.name = "Missing";
    definition.steps.push_back(CompositeStep{"StepA", "A"});
    CompositeStep b{"StepB", "B"};
    b.depends_on = "StepA";
    b.template_transformations = {{"id", "$prev.StepA.items.0.id"}};
    definition.steps.push_back(b);
    CompositeStep c{"StepC", "C"};
    c.depends_on = "StepB";
    definition.steps.push_back(c);

    auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());

    REQUIRE_FALSE(result.success);
    CHECK(result.error == CompositeError::TemplateReferenceUnresolved);
    CHECK(result.failed_step == "StepB");
    CHECK(result.http_status() == 400);
    CHECK_THAT(result.error_message, ContainsSubstring("items.0.id"));
    CHECK(f.invoker->total_calls() == 1);
}

// ============================================================================
// Error taxonomy
// ============================================================================

TEST_CASE("Composite error kinds map to statuses", "[composite][errors]") {
    CompositeFixture f;
    f.publish({standard_endpoint("Orders", "http://svc.internal/orders")});

    SECTION("Unknown target endpoint") {
        CompositeDefinition definition;
        definition.name = "Typo";
        definition.steps.push_back(CompositeStep{"Create", "Order"});

        auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());
        CHECK(result.error == CompositeError::StepNotFound);
        CHECK(result.http_status() == 404);
        CHECK_THAT(result.error_message, ContainsSubstring("Did you mean"));
        CHECK(f.invoker->total_calls() == 0);
    }

    SECTION("Body that is not JSON") {
        CompositeDefinition definition;
        definition.name = "Bad";
        definition.steps.push_back(CompositeStep{"Create", "Orders"});

        auto result = f.orchestrator().execute(definition, std::string_view("{not json"), "prod",
                                               f.metadata());
        CHECK(result.error == CompositeError::MalformedInputDocument);
        CHECK(result.http_status() == 400);
    }

    SECTION("Array property missing") {
        CompositeDefinition definition;
        definition.name = "NoLines";
        CompositeStep step{"Create", "Orders"};
        step.is_array = true;
        step.array_property = "Lines";
        definition.steps.push_back(step);

        auto result = f.orchestrator().execute(definition, json{{"Header", json::object()}}, "prod",
                                               f.metadata());
        CHECK(result.error == CompositeError::MalformedInputDocument);
        CHECK(result.failed_step == "Create");
    }

    SECTION("Backend unreachable") {
        f.invoker->fail("http://svc.internal/orders", "Connection refused");
        CompositeDefinition definition;
        definition.name = "Down";
        definition.steps.push_back(CompositeStep{"Create", "Orders"});

        auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());
        CHECK(result.error == CompositeError::TransportError);
        CHECK(result.status_code == 0);
        CHECK(result.http_status() == 502);
        CHECK(result.error_detail == "Connection refused");
    }

    SECTION("Backend 5xx with a plain body") {
        f.invoker->respond("http://svc.internal/orders", 500, "upstream exploded", "text/plain");
        CompositeDefinition definition;
        definition.name = "Boom";
        definition.steps.push_back(CompositeStep{"Create", "Orders"});

        auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());
        CHECK(result.error == CompositeError::BackendCallFailed);
        CHECK(result.http_status() == 500);
        CHECK(result.error_detail == "upstream exploded");
        CHECK_FALSE(result.structured_error.has_value());
    }

    SECTION("Cycle in the definition") {
        CompositeDefinition definition;
        definition.name = "Loop";
        CompositeStep a{"A", "Orders"};
        a.depends_on = "B";
        CompositeStep b{"B", "Orders"};
        b.depends_on = "A";
        definition.steps = {a, b};

        auto result = f.orchestrator().execute(definition, json::object(), "prod", f.metadata());
        CHECK(result.error == CompositeError::InvalidDefinition);
        CHECK(result.http_status() == 500);
        CHECK(f.invoker->total_calls() == 0);
    }

    SECTION("Cancelled request") {
        auto md = f.metadata();
        md.cancellation = std::make_shared<CancellationToken>();
        md.cancellation->cancel();
        CompositeDefinition definition;
        definition.name = "Cancelled";
        definition.steps.push_back(CompositeStep{"Create", "Orders"});

        auto result = f.orchestrator().execute(definition, json::object(), "prod", md);
        CHECK(result.error == CompositeError::Cancelled);
        CHECK(result.http_status() == 503);
        CHECK(f.invoker->total_calls() == 0);
    }
}

TEST_CASE("Long error bodies are truncated", "[composite][errors]") {
    std::optional<json> structured;
    std::string body(CompositeOrchestrator::MAX_ERROR_DETAIL_BYTES + 500, 'x');

    auto detail = extract_error_detail(body, structured);
    CHECK(detail.size() == CompositeOrchestrator::MAX_ERROR_DETAIL_BYTES + 3);
    CHECK(detail.ends_with("..."));
    CHECK_FALSE(structured.has_value());

    CHECK(extract_error_detail(R"({"message":"bad input"})", structured) == "bad input");
    CHECK(structured.has_value());
    CHECK(extract_error_detail(R"({"title":"Not Found","status":404})", structured) == "Not Found");
}

// ============================================================================
// Request shaping and result rewriting
// ============================================================================

TEST_CASE("Step calls carry correlation and forwarded headers", "[composite]") {
    CompositeFixture f;
    f.publish({standard_endpoint("Orders", "http://svc.internal/orders")});
    f.invoker->echo("http://svc.internal/orders");

    CompositeDefinition definition;
    definition.name = "Headers";
    CompositeStep step{"Create", "Orders"};
    step.template_transformations = {{"env", "$context.environment"}, {"source", "portal"}};
    definition.steps.push_back(step);

    auto md = f.metadata();
    md.forward_headers["Accept-Language"] = "nl-NL";
    auto result = f.orchestrator().execute(definition, json{{"a", 1}}, "test", md);
    REQUIRE(result.success);

    auto calls = f.invoker->calls();
    REQUIRE(calls.size() == 1);
    CHECK(conduit::http::find_header(calls[0].headers, "X-Correlation-ID") == "test-correlation");
    CHECK(conduit::http::find_header(calls[0].headers, "Accept-Language") == "nl-NL");
    CHECK(calls[0].content_type == "application/json");

    auto sent = json::parse(calls[0].body);
    CHECK(sent["a"] == 1);
    CHECK(sent["env"] == "test");
    CHECK(sent["source"] == "portal");
}

TEST_CASE("Backend URLs in results become gateway URLs", "[composite][rewrite]") {
    CompositeFixture f;
    f.publish({standard_endpoint("Orders", "http://erp.internal:8080/odata/orders"),
               standard_endpoint("Customers", "http://erp.internal:8080/odata/customers")});
    f.invoker->respond("http://erp.internal:8080/odata/orders", 200,
                       R"({"image":"http://cdn.example.net/img/1.png",)"
                       R"("customer":"http://erp.internal:8080/odata/customers/42"})");

    CompositeDefinition definition;
    definition.name = "Links";
    definition.steps.push_back(CompositeStep{"Create", "Orders"});

    auto md = f.metadata();
    md.public_base = "https://api.example.com";
    auto result = f.orchestrator().execute(definition, json::object(), "prod", md);
    REQUIRE(result.success);

    const auto* value = result.result_of("Create");
    REQUIRE(value != nullptr);
    CHECK((*value)["customer"] == "https://api.example.com/api/prod/Customers/42");
    CHECK((*value)["image"] == "http://cdn.example.net/img/1.png");
}
