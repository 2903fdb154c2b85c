/**
 * @file LoginHandlerTest.cpp
 * @brief Unit-тесты для LoginHandler
 *
 * POST /api/login - логин в Odoo
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/LoginHandler.hpp"
#include "mocks/MockSessionBridge.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace relay;
using namespace relay::adapters::primary;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Test Fixture
// ============================================================================

class LoginHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_ = std::make_shared<tests::MockSessionBridge>();
        handler_ = std::make_unique<LoginHandler>(bridge_);
    }

    SimpleRequest createRequest(const std::string& body) {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/login");
        req.setHeader("Content-Type", "application/json");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<tests::MockSessionBridge> bridge_;
    std::unique_ptr<LoginHandler> handler_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(LoginHandlerTest, Success_ReturnsUid) {
    EXPECT_CALL(*bridge_, login(_, _))
        .WillOnce([](const domain::OdooConfig& config, const nlohmann::json& id) {
            EXPECT_EQ(config.url, "https://erp.example.com");
            EXPECT_EQ(config.db, "production");
            EXPECT_EQ(config.username, "admin");
            EXPECT_EQ(config.password, "secret");
            EXPECT_EQ(id, 3);
            return ports::input::LoginResult{true, 7, {}};
        });

    auto req = createRequest(R"({
        "odooConfig": {"url": "https://erp.example.com", "db": "production",
                       "username": "admin", "password": "secret"},
        "id": 3
    })");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json, nlohmann::json({{"result", 7}}));
}

TEST_F(LoginHandlerTest, NonScalarId_PassedAsNull) {
    EXPECT_CALL(*bridge_, login(_, _))
        .WillOnce([](const domain::OdooConfig&, const nlohmann::json& id) {
            EXPECT_TRUE(id.is_null());
            return ports::input::LoginResult{true, 7, {}};
        });

    auto req = createRequest(R"({"odooConfig": {"db": "d", "username": "u", "password": "p"}, "id": [1]})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(LoginHandlerTest, BooleanId_PassedThrough) {
    EXPECT_CALL(*bridge_, login(_, _))
        .WillOnce([](const domain::OdooConfig&, const nlohmann::json& id) {
            EXPECT_EQ(id, true);
            return ports::input::LoginResult{true, 7, {}};
        });

    auto req = createRequest(R"({"odooConfig": {"db": "d", "username": "u", "password": "p"}, "id": true})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(LoginHandlerTest, BridgeError_MappedToStatusAndBody) {
    EXPECT_CALL(*bridge_, login(_, _))
        .WillOnce(Return(ports::input::LoginResult{
            false, nullptr,
            domain::RelayError::authenticationFailed("Odoo Server Error", {{"code", 200}})}));

    auto req = createRequest(R"({"odooConfig": {"db": "d", "username": "u", "password": "bad"}})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Odoo Server Error");
    EXPECT_EQ(json["details"]["code"], 200);
}

TEST_F(LoginHandlerTest, MissingConfig_StillDelegatesToBridge) {
    EXPECT_CALL(*bridge_, login(_, _))
        .WillOnce([](const domain::OdooConfig& config, const nlohmann::json&) {
            EXPECT_FALSE(config.hasCredentials());
            return ports::input::LoginResult{
                false, nullptr, domain::RelayError::invalidInput("Missing Odoo configuration")};
        });

    auto req = createRequest(R"({"id": 1})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(LoginHandlerTest, InvalidJson_Returns400) {
    EXPECT_CALL(*bridge_, login(_, _)).Times(0);

    auto req = createRequest("{not json");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "Invalid JSON");
}

TEST_F(LoginHandlerTest, NonObjectBody_Returns400) {
    EXPECT_CALL(*bridge_, login(_, _)).Times(0);

    auto req = createRequest("[1, 2, 3]");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
