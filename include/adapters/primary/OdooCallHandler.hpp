#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpJson.hpp"
#include "ports/input/ISessionBridge.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace relay::adapters::primary {

/**
 * @brief Проксирование call_kw в Odoo
 *
 * POST /api/odoo
 * X-API-Key: <secret>
 * {
 *   "model": "res.partner",
 *   "method": "search_read",
 *   "args": [[["is_company", "=", true]]],
 *   "kwargs": {"fields": ["name"], "limit": 5},
 *   "odooConfig": {"url": "https://erp.example.com"}
 * }
 *
 * Response: JSON-RPC ответ Odoo без изменений.
 */
class OdooCallHandler : public IHttpHandler {
public:
    explicit OdooCallHandler(std::shared_ptr<ports::input::ISessionBridge> bridge)
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

        domain::OdooCall call;
        call.model = HttpJson::stringField(body, "model");
        call.method = HttpJson::stringField(body, "method");
        if (body.contains("args") && !body["args"].is_null()) {
            call.args = body["args"];
        }
        if (body.contains("kwargs") && !body["kwargs"].is_null()) {
            call.kwargs = body["kwargs"];
        }
        auto odooConfig = body.find("odooConfig");
        if (odooConfig != body.end() && odooConfig->is_object()) {
            call.url = HttpJson::stringField(*odooConfig, "url");
        }
        call.id = HttpJson::correlationId(body);

        auto result = bridge_->call(call);
        if (!result.success) {
            HttpJson::sendError(res, result.error);
            return;
        }

        res.setResult(200, "application/json", result.body);
    }

private:
    std::shared_ptr<ports::input::ISessionBridge> bridge_;
};

} // namespace relay::adapters::primary
