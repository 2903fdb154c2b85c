/**
 * @file HealthHandlerTest.cpp
 * @brief Unit-тесты для GET /, GET /health, GET /metrics
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/RootHandler.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/MockSessionBridge.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace relay;
using namespace relay::adapters::primary;
using ::testing::Return;

namespace {

SimpleRequest getRequest(const std::string& path) {
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath(path);
    req.setPathPattern(path);
    return req;
}

} // namespace

TEST(HealthHandlerTest, ReportsSessionState) {
    auto bridge = std::make_shared<tests::MockSessionBridge>();
    EXPECT_CALL(*bridge, hasActiveSession()).WillOnce(Return(false)).WillOnce(Return(true));
    HealthHandler handler(bridge);

    auto req = getRequest("/health");
    SimpleResponse before;
    handler.handle(req, before);
    SimpleResponse after;
    handler.handle(req, after);

    EXPECT_EQ(before.getStatus(), 200);
    auto json = nlohmann::json::parse(before.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["service"], "odoo-relay");
    EXPECT_EQ(json["session_active"], false);
    EXPECT_EQ(nlohmann::json::parse(after.getBody())["session_active"], true);
}

TEST(HealthHandlerTest, RootPage_ListsEndpoints) {
    RootHandler handler;
    auto req = getRequest("/");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("Odoo Relay Server Running"), std::string::npos);
    EXPECT_NE(res.getBody().find("POST /api/odoo"), std::string::npos);
}

TEST(HealthHandlerTest, Metrics_PrometheusText) {
    auto metrics = std::make_shared<application::MetricsService>(
        std::make_shared<settings::MetricsSettings>());
    metrics->increment("relay_logins_total", {{"outcome", "success"}});
    MetricsHandler handler(metrics);

    auto req = getRequest("/metrics");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto contentType = res.getHeader("Content-Type");
    ASSERT_TRUE(contentType.has_value());
    EXPECT_NE(contentType->find("text/plain"), std::string::npos);
    EXPECT_NE(res.getBody().find("relay_logins_total{outcome=\"success\"} 1"), std::string::npos);
}
