/**
 * @file OdooCallHandlerTest.cpp
 * @brief Unit-тесты для OdooCallHandler
 *
 * POST /api/odoo - call_kw в Odoo
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/OdooCallHandler.hpp"
#include "mocks/MockSessionBridge.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace relay;
using namespace relay::adapters::primary;
using ::testing::_;
using ::testing::Return;

class OdooCallHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_ = std::make_shared<tests::MockSessionBridge>();
        handler_ = std::make_unique<OdooCallHandler>(bridge_);
    }

    SimpleRequest createRequest(const std::string& body) {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/odoo");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<tests::MockSessionBridge> bridge_;
    std::unique_ptr<OdooCallHandler> handler_;
};

TEST_F(OdooCallHandlerTest, Success_ReturnsOdooBodyVerbatim) {
    const std::string odooBody = R"({"jsonrpc": "2.0", "id": 9, "result": [{"id": 1, "name": "Azure"}]})";

    EXPECT_CALL(*bridge_, call(_))
        .WillOnce([&odooBody](const domain::OdooCall& call) {
            EXPECT_EQ(call.model, "res.partner");
            EXPECT_EQ(call.method, "search_read");
            EXPECT_EQ(call.args, nlohmann::json::parse(R"([[["is_company", "=", true]]])"));
            EXPECT_EQ(call.kwargs["limit"], 5);
            EXPECT_EQ(call.url, "https://erp.example.com");
            EXPECT_EQ(call.id, 9);
            return ports::input::CallResult{true, odooBody, {}};
        });

    auto req = createRequest(R"({
        "model": "res.partner", "method": "search_read",
        "args": [[["is_company", "=", true]]], "kwargs": {"limit": 5},
        "odooConfig": {"url": "https://erp.example.com"}, "id": 9, "uid": 7
    })");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getBody(), odooBody);
}

TEST_F(OdooCallHandlerTest, MissingArgsAndKwargs_DefaultToEmpty) {
    EXPECT_CALL(*bridge_, call(_))
        .WillOnce([](const domain::OdooCall& call) {
            EXPECT_EQ(call.args, nlohmann::json::array());
            EXPECT_EQ(call.kwargs, nlohmann::json::object());
            EXPECT_TRUE(call.url.empty());
            EXPECT_TRUE(call.id.is_null());
            return ports::input::CallResult{true, "{}", {}};
        });

    auto req = createRequest(R"({"model": "res.users", "method": "read", "args": null})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(OdooCallHandlerTest, NoSession_Returns401) {
    EXPECT_CALL(*bridge_, call(_))
        .WillOnce(Return(ports::input::CallResult{false, "", domain::RelayError::noActiveSession()}));

    auto req = createRequest(R"({"model": "res.partner", "method": "search_read"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Unauthorized: No active Odoo session. Please log in.");
    EXPECT_FALSE(json.contains("details"));
}

TEST_F(OdooCallHandlerTest, UpstreamRejected_MirrorsStatus) {
    EXPECT_CALL(*bridge_, call(_))
        .WillOnce(Return(ports::input::CallResult{
            false, "", domain::RelayError::upstreamRejected(404, "Odoo API error", "Not Found")}));

    auto req = createRequest(R"({"model": "res.partner", "method": "search_read"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Odoo API error");
    EXPECT_EQ(json["details"], "Not Found");
}

TEST_F(OdooCallHandlerTest, InvalidJson_Returns400WithoutBridgeCall) {
    EXPECT_CALL(*bridge_, call(_)).Times(0);

    auto req = createRequest("");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
