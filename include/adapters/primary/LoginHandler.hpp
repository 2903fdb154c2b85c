#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpJson.hpp"
#include "ports/input/ISessionBridge.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace relay::adapters::primary {

/**
 * @brief Логин в Odoo через релей
 *
 * POST /api/login
 * X-API-Key: <secret>
 * {
 *   "odooConfig": {
 *     "url": "https://erp.example.com",
 *     "db": "production",
 *     "username": "admin",
 *     "password": "secret"
 *   },
 *   "id": 1
 * }
 *
 * Response:
 * { "result": 7 }
 */
class LoginHandler : public IHttpHandler {
public:
    explicit LoginHandler(std::shared_ptr<ports::input::ISessionBridge> bridge)
        : bridge_(std::move(bridge))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::exception& e) {
            HttpJson::sendError(res, 400, "Invalid JSON");
            return;
        }
        if (!body.is_object()) {
            HttpJson::sendError(res, 400, "Request body must be a JSON object");
            return;
        }

        domain::OdooConfig config;
        auto odooConfig = body.find("odooConfig");
        if (odooConfig != body.end() && odooConfig->is_object()) {
            config.url = HttpJson::stringField(*odooConfig, "url");
            config.db = HttpJson::stringField(*odooConfig, "db");
            config.username = HttpJson::stringField(*odooConfig, "username");
            config.password = HttpJson::stringField(*odooConfig, "password");
        }

        auto result = bridge_->login(config, HttpJson::correlationId(body));
        if (!result.success) {
            HttpJson::sendError(res, result.error);
            return;
        }

        nlohmann::json response;
        response["result"] = result.uid;
        res.setResult(200, "application/json", HttpJson::dump(response));
    }

private:
    std::shared_ptr<ports::input::ISessionBridge> bridge_;
};

} // namespace relay::adapters::primary
