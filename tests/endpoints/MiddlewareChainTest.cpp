/**
 * @file MiddlewareChainTest.cpp
 * @brief Unit-тесты для ChainHandler, ApiKeyMiddleware, CorsMiddleware,
 *        MetricsMiddleware и PreflightHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/ApiKeyMiddleware.hpp"
#include "adapters/primary/CorsMiddleware.hpp"
#include "adapters/primary/MetricsMiddleware.hpp"
#include "adapters/primary/PreflightHandler.hpp"
#include "application/AccessGuard.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/FakeRelaySettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace relay;
using namespace relay::adapters::primary;

// ============================================================================
// Handler-заглушка: считает вызовы и отвечает 200
// ============================================================================

class CountingHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse& res) override {
        ++calls;
        res.setResult(200, "application/json", R"({"ok":true})");
    }

    int calls = 0;
};

// Ничего не отвечает, как middleware
class SilentHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse& res) override { res.setStatus(0); }
};

// ============================================================================
// Test Fixture
// ============================================================================

class MiddlewareChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<tests::FakeRelaySettings>();
        settings_->apiKey = "s3cret";
        settings_->allowedOrigins = {"https://imitrr.github.io", "http://localhost:5173"};

        metrics_ = std::make_shared<application::MetricsService>(
            std::make_shared<settings::MetricsSettings>());
        handler_ = std::make_shared<CountingHandler>();

        chain_ = std::make_shared<ChainHandler>(
            std::make_shared<MetricsMiddleware>(metrics_),
            std::make_shared<CorsMiddleware>(settings_),
            std::make_shared<ApiKeyMiddleware>(std::make_shared<application::AccessGuard>(settings_)),
            handler_);
    }

    SimpleRequest createRequest(const std::string& apiKey = "", const std::string& origin = "",
                                const std::string& path = "/api/odoo") {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath(path);
        req.setPathPattern("/api/odoo");
        if (!apiKey.empty()) {
            req.setHeader("X-API-Key", apiKey);
        }
        if (!origin.empty()) {
            req.setHeader("Origin", origin);
        }
        req.setBody("{}");
        return req;
    }

    std::shared_ptr<tests::FakeRelaySettings> settings_;
    std::shared_ptr<application::MetricsService> metrics_;
    std::shared_ptr<CountingHandler> handler_;
    std::shared_ptr<ChainHandler> chain_;
};

// ============================================================================
// ТЕСТЫ: X-API-Key
// ============================================================================

TEST_F(MiddlewareChainTest, ValidApiKey_ReachesHandler) {
    auto req = createRequest("s3cret");
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(handler_->calls, 1);
    EXPECT_EQ(metrics_->value("http_requests_total", {{"method", "POST"}, {"path", "/api/odoo"}}), 1);
}

TEST_F(MiddlewareChainTest, Metrics_LabelledByRoutePatternNotRawPath) {
    auto req = createRequest("s3cret", "", "/api/odoo/../odoo?cache=1");
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(metrics_->value("http_requests_total", {{"method", "POST"}, {"path", "/api/odoo"}}), 1);
    EXPECT_EQ(metrics_->droppedCount(), 0);
    EXPECT_EQ(metrics_->toPrometheusFormat().find("cache=1"), std::string::npos);
}

TEST_F(MiddlewareChainTest, MissingApiKey_Returns403) {
    auto req = createRequest();
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
    EXPECT_EQ(handler_->calls, 0);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Unauthorized: Invalid API key");
}

TEST_F(MiddlewareChainTest, WrongApiKey_Returns403AndIsStillCounted) {
    auto req = createRequest("guess");
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
    EXPECT_EQ(handler_->calls, 0);
    EXPECT_EQ(metrics_->value("http_requests_total", {{"method", "POST"}, {"path", "/api/odoo"}}), 1);
}

TEST_F(MiddlewareChainTest, EmptyServerKey_RejectsEmptyClientKey) {
    settings_->apiKey = "";
    ChainHandler chain(
        std::make_shared<ApiKeyMiddleware>(std::make_shared<application::AccessGuard>(settings_)),
        handler_);

    auto req = createRequest();
    req.setHeader("X-API-Key", "");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
    EXPECT_EQ(handler_->calls, 0);
}

// ============================================================================
// ТЕСТЫ: CORS
// ============================================================================

TEST_F(MiddlewareChainTest, AllowedOrigin_GetsCorsHeaders) {
    auto req = createRequest("s3cret", "http://localhost:5173");
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Origin").value_or(""), "http://localhost:5173");
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Credentials").value_or(""), "true");
}

TEST_F(MiddlewareChainTest, ForeignOrigin_Returns403BeforeApiKeyCheck) {
    auto req = createRequest("s3cret", "https://evil.example");
    SimpleResponse res;
    chain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
    EXPECT_EQ(handler_->calls, 0);
    EXPECT_FALSE(res.getHeader("Access-Control-Allow-Origin").has_value());
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"],
              "The CORS policy for this site does not allow access from the specified Origin.");
}

TEST_F(MiddlewareChainTest, Preflight_Returns204WithAllowHeaders) {
    ChainHandler preflight(
        std::make_shared<CorsMiddleware>(settings_),
        std::make_shared<PreflightHandler>());

    SimpleRequest req;
    req.setMethod("OPTIONS");
    req.setPath("/api/login");
    req.setHeader("Origin", "https://imitrr.github.io");
    SimpleResponse res;
    preflight.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Origin").value_or(""), "https://imitrr.github.io");
    EXPECT_NE(res.getHeader("Access-Control-Allow-Headers").value_or("").find("X-API-Key"),
              std::string::npos);
}

// ============================================================================
// ТЕСТЫ: ChainHandler
// ============================================================================

TEST_F(MiddlewareChainTest, ChainWithoutResponse_Returns500) {
    ChainHandler chain(std::make_shared<SilentHandler>(), std::make_shared<SilentHandler>());

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}
