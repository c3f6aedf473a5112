// Conduit Pipeline Unit Tests

#include "../../src/gateway/pipeline.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace conduit::gateway;
using conduit::http::find_header;

namespace {

struct ContextFixture {
    GatewayRequest request;
    GatewayResponse response;
    RequestContext ctx;

    ContextFixture() {
        request.path = "/api/prod/Items";
        ctx.request = &request;
        ctx.response = &response;
        ctx.start_time = std::chrono::steady_clock::now();
    }
};

/// Records both phases into a shared trace
class TracingMiddleware : public Middleware {
public:
    TracingMiddleware(std::string name, std::vector<std::string>& trace,
                      MiddlewareResult request_result = MiddlewareResult::Continue)
        : name_(std::move(name)), trace_(trace), request_result_(request_result) {}

    MiddlewareResult process_request(RequestContext&) override {
        trace_.push_back(name_ + ".request");
        return request_result_;
    }

    MiddlewareResult process_response(RequestContext&) override {
        trace_.push_back(name_ + ".response");
        return MiddlewareResult::Continue;
    }

    std::string_view name() const override { return name_; }

private:
    std::string name_;
    std::vector<std::string>& trace_;
    MiddlewareResult request_result_;
};

}  // namespace

// ============================================================================
// Pipeline ordering
// ============================================================================

TEST_CASE("Pipeline runs request phase forward and response phase in reverse", "[pipeline]") {
    std::vector<std::string> trace;
    PipelineBuilder builder;
    builder.use(std::make_unique<TracingMiddleware>("a", trace))
        .use(std::make_unique<TracingMiddleware>("b", trace));
    auto pipeline = std::move(builder).build();
    REQUIRE(pipeline.size() == 2);

    ContextFixture f;
    CHECK(pipeline.execute_request(f.ctx) == MiddlewareResult::Continue);
    CHECK(pipeline.execute_response(f.ctx) == MiddlewareResult::Continue);
    CHECK(trace == std::vector<std::string>{"a.request", "b.request", "b.response", "a.response"});
}

TEST_CASE("Stop short-circuits the request phase only", "[pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.use(std::make_unique<TracingMiddleware>("a", trace));
    pipeline.use(std::make_unique<TracingMiddleware>("b", trace, MiddlewareResult::Stop));
    pipeline.use(std::make_unique<TracingMiddleware>("c", trace));

    ContextFixture f;
    CHECK(pipeline.execute_request(f.ctx) == MiddlewareResult::Stop);
    (void)pipeline.execute_response(f.ctx);
    CHECK(trace == std::vector<std::string>{"a.request", "b.request", "c.response", "b.response",
                                            "a.response"});
}

TEST_CASE("Context errors end the request phase", "[pipeline]") {
    class FailingMiddleware : public Middleware {
    public:
        MiddlewareResult process_request(RequestContext& ctx) override {
            ctx.set_error("boom");
            return MiddlewareResult::Continue;
        }
        std::string_view name() const override { return "Failing"; }
    };

    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.use(std::make_unique<FailingMiddleware>());
    pipeline.use(std::make_unique<TracingMiddleware>("after", trace));

    ContextFixture f;
    CHECK(pipeline.execute_request(f.ctx) == MiddlewareResult::Error);
    CHECK(f.ctx.has_error);
    CHECK(f.ctx.error_message == "boom");
    CHECK(trace.empty());
}

// ============================================================================
// Built-in middleware
// ============================================================================

TEST_CASE("Logging middleware correlation ids", "[pipeline][logging]") {
    conduit::control::LogConfig config;
    config.log_requests = false;
    LoggingMiddleware middleware(config);

    SECTION("Generated when absent") {
        ContextFixture f;
        CHECK(middleware.process_request(f.ctx) == MiddlewareResult::Continue);
        CHECK_FALSE(f.ctx.correlation_id.empty());
        (void)middleware.process_response(f.ctx);
        CHECK(find_header(f.response.headers, "X-Correlation-ID") == f.ctx.correlation_id);
    }

    SECTION("Caller id is reused") {
        ContextFixture f;
        f.request.headers["x-correlation-id"] = "abc-123";
        (void)middleware.process_request(f.ctx);
        CHECK(f.ctx.correlation_id == "abc-123");
    }

    SECTION("Unsafe caller id is replaced") {
        ContextFixture f;
        f.request.headers["X-Correlation-ID"] = "abc\r\nInjected: 1";
        (void)middleware.process_request(f.ctx);
        CHECK(f.ctx.correlation_id != "abc\r\nInjected: 1");
        CHECK(f.ctx.correlation_id.find('\n') == std::string::npos);
    }

    SECTION("Missing request is an error") {
        RequestContext empty;
        CHECK(middleware.process_request(empty) == MiddlewareResult::Error);
    }
}

TEST_CASE("Bearer token extraction", "[pipeline][auth]") {
    CHECK(AuthMiddleware::extract_bearer_token("Bearer abc") == "abc");
    CHECK(AuthMiddleware::extract_bearer_token("bearer   abc  ") == "abc");
    CHECK(AuthMiddleware::extract_bearer_token("Basic abc").empty());
    CHECK(AuthMiddleware::extract_bearer_token("Bearer").empty());
    CHECK(AuthMiddleware::extract_bearer_token("").empty());
}

TEST_CASE("Auth middleware", "[pipeline][auth]") {
    conduit::control::AuthConfig config;
    config.enabled = true;
    config.valid_tokens = {"token-one", "token-two"};
    AuthMiddleware auth(config);

    SECTION("Missing token") {
        ContextFixture f;
        CHECK(auth.process_request(f.ctx) == MiddlewareResult::Stop);
        CHECK(f.response.status == 401);
        CHECK(find_header(f.response.headers, "WWW-Authenticate") == "Bearer");
    }

    SECTION("Unknown token") {
        ContextFixture f;
        f.request.headers["Authorization"] = "Bearer token-three";
        CHECK(auth.process_request(f.ctx) == MiddlewareResult::Stop);
        CHECK(f.response.status == 403);
    }

    SECTION("Valid token") {
        ContextFixture f;
        f.request.headers["Authorization"] = "Bearer token-two";
        CHECK(auth.process_request(f.ctx) == MiddlewareResult::Continue);
    }

    SECTION("Exempt path") {
        ContextFixture f;
        f.request.path = "/health/live";
        CHECK(auth.process_request(f.ctx) == MiddlewareResult::Continue);
    }

    SECTION("Disabled") {
        config.enabled = false;
        AuthMiddleware disabled(config);
        ContextFixture f;
        CHECK(disabled.process_request(f.ctx) == MiddlewareResult::Continue);
    }
}

TEST_CASE("Security headers middleware", "[pipeline][security]") {
    ContextFixture f;
    f.response.headers["Server"] = "Microsoft-IIS/10.0";
    f.response.headers["X-Powered-By"] = "ASP.NET";

    SecurityHeadersMiddleware middleware;
    CHECK(middleware.process_response(f.ctx) == MiddlewareResult::Continue);
    CHECK(find_header(f.response.headers, "X-Content-Type-Options") == "nosniff");
    CHECK(find_header(f.response.headers, "X-Frame-Options") == "DENY");
    CHECK(find_header(f.response.headers, "Content-Security-Policy") == "default-src 'self'");
    CHECK(f.response.headers.count("Server") == 0);
    CHECK(f.response.headers.count("X-Powered-By") == 0);
}
