// Conduit Backend Invoker Unit Tests

#include "../../src/gateway/backend_invoker.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace conduit::gateway;
using Catch::Matchers::ContainsSubstring;
using conduit::http::find_header;
using conduit::http::Method;

namespace {

/// httplib server on an ephemeral localhost port for the duration of a test
class LocalBackend {
public:
    LocalBackend() {
        server_.Get("/items", [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("X-Echo-Query", req.get_param_value("$top"));
            res.set_header("X-Echo-Correlation", req.get_header_value("X-Correlation-ID"));
            res.set_content(R"({"value":[1,2]})", "application/json");
        });
        server_.Post("/items", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_content(req.body, req.get_header_value("Content-Type"));
        });
        server_.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("nope", "text/plain");
        });
        server_.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            res.set_content("late", "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~LocalBackend() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};

}  // namespace

// ============================================================================
// Cancellation token
// ============================================================================

TEST_CASE("Cancellation token callbacks", "[invoker][cancellation]") {
    CancellationToken token;
    int fired = 0;

    auto kept = token.subscribe([&fired] { ++fired; });
    auto removed = token.subscribe([&fired] { fired += 100; });
    CHECK(kept != 0);
    CHECK(removed != kept);
    token.unsubscribe(removed);

    CHECK_FALSE(token.cancelled());
    token.cancel();
    CHECK(token.cancelled());
    CHECK(fired == 1);

    SECTION("Second cancel is a no-op") {
        token.cancel();
        CHECK(fired == 1);
    }

    SECTION("Late subscribers run immediately") {
        auto id = token.subscribe([&fired] { fired += 10; });
        CHECK(id == 0);
        CHECK(fired == 11);
    }
}

TEST_CASE("Unsubscribe waits for a running callback", "[invoker][cancellation]") {
    CancellationToken token;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    std::atomic<int> later_runs{0};

    auto slow = token.subscribe([&] {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
    });
    auto later = token.subscribe([&] { ++later_runs; });

    std::thread canceller([&] { token.cancel(); });
    while (!entered) {
        std::this_thread::yield();
    }

    // Callback that has not started yet is dropped
    token.unsubscribe(later);
    // Returns only once the running callback is done with its captures
    token.unsubscribe(slow);
    CHECK(finished);

    canceller.join();
    CHECK(later_runs == 0);
    CHECK(token.cancelled());

    SECTION("Id of a late subscriber is ignored") {
        token.unsubscribe(0);
        CHECK(token.cancelled());
    }
}

// ============================================================================
// HTTP invoker
// ============================================================================

TEST_CASE("Invoker rejects unusable requests without a connection", "[invoker]") {
    HttpBackendInvoker invoker(conduit::control::BackendConfig{});
    std::string error;

    SECTION("Invalid URL") {
        BackendRequest request;
        request.url = "not a url";
        CHECK_FALSE(invoker.invoke(request, error).has_value());
        CHECK_THAT(error, ContainsSubstring("Invalid backend URL"));
    }

    SECTION("Already cancelled") {
        BackendRequest request;
        request.url = "http://127.0.0.1:9/items";
        request.cancellation = std::make_shared<CancellationToken>();
        request.cancellation->cancel();
        CHECK_FALSE(invoker.invoke(request, error).has_value());
        CHECK(error == "Request cancelled");
    }
}

TEST_CASE("Invoker talks to a live backend", "[invoker][network]") {
    LocalBackend backend;
    conduit::control::BackendConfig config;
    config.connect_timeout_ms = 1000;
    HttpBackendInvoker invoker(config);
    std::string error;

    SECTION("GET with query and headers") {
        BackendRequest request;
        request.url = backend.url("/items?$top=5");
        request.headers["X-Correlation-ID"] = "corr-9";
        auto response = invoker.invoke(request, error);
        REQUIRE(response.has_value());
        CHECK(response->status_code == 200);
        CHECK(response->body == R"({"value":[1,2]})");
        CHECK(response->content_type() == "application/json");
        CHECK(find_header(response->headers, "X-Echo-Query") == "5");
        CHECK(find_header(response->headers, "X-Echo-Correlation") == "corr-9");
    }

    SECTION("POST body with content type") {
        BackendRequest request;
        request.url = backend.url("/items");
        request.method = Method::POST;
        request.body = R"({"Sku":"A"})";
        request.content_type = "application/json";
        auto response = invoker.invoke(request, error);
        REQUIRE(response.has_value());
        CHECK(response->status_code == 201);
        CHECK(response->body == R"({"Sku":"A"})");
    }

    SECTION("Error statuses are responses") {
        BackendRequest request;
        request.url = backend.url("/missing");
        auto response = invoker.invoke(request, error);
        REQUIRE(response.has_value());
        CHECK(response->status_code == 404);
        CHECK(response->body == "nope");
    }

    SECTION("Read timeout is a transport error") {
        BackendRequest request;
        request.url = backend.url("/slow");
        request.timeout = std::chrono::milliseconds(200);
        CHECK_FALSE(invoker.invoke(request, error).has_value());
        CHECK_THAT(error, ContainsSubstring("failed"));
    }

    SECTION("Cancellation interrupts an in-flight call") {
        BackendRequest request;
        request.url = backend.url("/slow");
        request.cancellation = std::make_shared<CancellationToken>();

        std::thread canceller([token = request.cancellation] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token->cancel();
        });
        auto started = std::chrono::steady_clock::now();
        auto response = invoker.invoke(request, error);
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();

        CHECK_FALSE(response.has_value());
        CHECK(error == "Request cancelled");
        CHECK(elapsed < std::chrono::milliseconds(1400));
    }
}

TEST_CASE("Connection refused is a transport error", "[invoker][network]") {
    conduit::control::BackendConfig config;
    config.connect_timeout_ms = 500;
    HttpBackendInvoker invoker(config);

    int port = 0;
    {
        // Grab a free port, then close it again
        httplib::Server probe;
        port = probe.bind_to_any_port("127.0.0.1");
    }

    BackendRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/items";
    std::string error;
    CHECK_FALSE(invoker.invoke(request, error).has_value());
    CHECK_THAT(error, ContainsSubstring("127.0.0.1"));
}
