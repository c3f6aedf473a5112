// Health Check Tests

#include "control/health.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace conduit::control;

namespace {

MetricsSnapshot with_requests(uint64_t total, uint64_t errors) {
    MetricsSnapshot snapshot;
    snapshot.total_requests = total;
    snapshot.total_errors = errors;
    snapshot.status_5xx = errors;
    return snapshot;
}

}  // namespace

TEST_CASE("HealthChecker status from error rate", "[control][health]") {
    HealthChecker checker("1.0");
    checker.start();

    SECTION("No traffic") {
        auto health = checker.get_server_health(MetricsSnapshot{});
        REQUIRE(health.status == HealthStatus::Healthy);
        REQUIRE(health.version == "1.0");
        REQUIRE(health.components.empty());
    }

    SECTION("Below 10% is healthy") {
        REQUIRE(checker.get_server_health(with_requests(100, 9)).status == HealthStatus::Healthy);
    }

    SECTION("Degraded status") {
        // 2 errors out of 10 = 20%
        REQUIRE(checker.get_server_health(with_requests(10, 2)).status == HealthStatus::Degraded);
    }

    SECTION("Unhealthy at 50%") {
        REQUIRE(checker.get_server_health(with_requests(2, 1)).status == HealthStatus::Unhealthy);
    }
}

TEST_CASE("Component probes", "[control][health]") {
    HealthChecker checker;
    checker.start();

    checker.add_probe([] { return ComponentHealth{"endpoints", HealthStatus::Healthy, "12 endpoints loaded"}; });

    SECTION("Healthy probe keeps healthy") {
        auto health = checker.get_server_health(MetricsSnapshot{});
        REQUIRE(health.status == HealthStatus::Healthy);
        REQUIRE(health.components.size() == 1);
        REQUIRE(health.components[0].detail == "12 endpoints loaded");
    }

    SECTION("Worst component wins") {
        checker.add_probe([] { return ComponentHealth{"redis", HealthStatus::Degraded, "connection refused"}; });
        auto health = checker.get_server_health(MetricsSnapshot{});
        REQUIRE(health.status == HealthStatus::Degraded);
        REQUIRE(health.components.size() == 2);

        checker.add_probe([] { return ComponentHealth{"disk", HealthStatus::Unhealthy, {}}; });
        REQUIRE(checker.get_server_health(MetricsSnapshot{}).status == HealthStatus::Unhealthy);
    }

    SECTION("Probe cannot improve a bad error rate") {
        REQUIRE(checker.get_server_health(with_requests(4, 2)).status == HealthStatus::Unhealthy);
    }
}

TEST_CASE("HealthResponse formatting", "[control][health]") {
    ServerHealth health;
    health.status = HealthStatus::Degraded;
    health.uptime = std::chrono::seconds(3600);
    health.version = "2.1";
    health.metrics = with_requests(1000, 10);
    health.metrics.proxy_requests = 900;
    health.metrics.composite_requests = 100;
    health.metrics.composite_failures = 3;
    health.components.push_back(ComponentHealth{"redis", HealthStatus::Degraded, "timeout"});
    health.components.push_back(ComponentHealth{"endpoints", HealthStatus::Healthy, {}});

    SECTION("JSON format") {
        auto json = nlohmann::json::parse(HealthResponse::to_json(health));

        REQUIRE(json["status"] == "degraded");
        REQUIRE(json["uptime_seconds"] == 3600);
        REQUIRE(json["version"] == "2.1");
        REQUIRE(json["metrics"]["total_requests"] == 1000);
        REQUIRE(json["metrics"]["total_errors"] == 10);
        REQUIRE(json["metrics"]["composite_failures"] == 3);
        REQUIRE(json["components"].size() == 2);
        REQUIRE(json["components"][0]["detail"] == "timeout");
        REQUIRE_FALSE(json["components"][1].contains("detail"));
    }

    SECTION("Text format") {
        std::string text = HealthResponse::to_text(health);

        REQUIRE(text.find("degraded") == 0);
        REQUIRE(text.find("3600s") != std::string::npos);
        REQUIRE(text.find("requests: 1000") != std::string::npos);
        REQUIRE(text.find("redis: degraded (timeout)") != std::string::npos);
    }

    SECTION("HTTP status codes") {
        REQUIRE(HealthResponse::to_http_status(HealthStatus::Healthy) == 200);
        REQUIRE(HealthResponse::to_http_status(HealthStatus::Degraded) == 200);
        REQUIRE(HealthResponse::to_http_status(HealthStatus::Unhealthy) == 503);
    }
}

TEST_CASE("Gateway metrics counters", "[control][metrics]") {
    GatewayMetrics metrics;

    metrics.record_request(200, std::chrono::microseconds(100));
    metrics.record_request(404, std::chrono::microseconds(50));
    metrics.record_request(502, std::chrono::microseconds(400));
    metrics.record_proxy();
    metrics.record_composite(true);
    metrics.record_composite(false);

    auto snapshot = metrics.snapshot();
    REQUIRE(snapshot.total_requests == 3);
    REQUIRE(snapshot.status_2xx == 1);
    REQUIRE(snapshot.status_4xx == 1);
    REQUIRE(snapshot.status_5xx == 1);
    REQUIRE(snapshot.total_errors == 1);
    REQUIRE(snapshot.min_latency_us == 50);
    REQUIRE(snapshot.max_latency_us == 400);
    REQUIRE(snapshot.avg_latency_us() == 550.0 / 3.0);
    REQUIRE(snapshot.proxy_requests == 1);
    REQUIRE(snapshot.composite_requests == 2);
    REQUIRE(snapshot.composite_failures == 1);
}

TEST_CASE("Server uptime calculation", "[control][health]") {
    HealthChecker checker;
    checker.start();

    auto health = checker.get_server_health(MetricsSnapshot{});

    // Uptime should be very small (close to 0)
    REQUIRE(health.uptime.count() >= 0);
    REQUIRE(health.uptime.count() < 10);
}
