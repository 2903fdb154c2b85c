#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionBridge.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace relay::adapters::primary {

class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::input::ISessionBridge> bridge)
        : bridge_(std::move(bridge))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "odoo-relay";
        response["version"] = "1.0.0";
        response["session_active"] = bridge_->hasActiveSession();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISessionBridge> bridge_;
};

} // namespace relay::adapters::primary
