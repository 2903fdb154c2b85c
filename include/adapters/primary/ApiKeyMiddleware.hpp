#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpJson.hpp"
#include "application/AccessGuard.hpp"
#include <iostream>
#include <memory>

namespace relay::adapters::primary {

/**
 * @brief Middleware проверки заголовка X-API-Key
 *
 * Без верного ключа: 403, дальше по цепочке запрос не идёт.
 */
class ApiKeyMiddleware : public IHttpHandler {
public:
    static constexpr const char* kHeader = "X-API-Key";

    explicit ApiKeyMiddleware(std::shared_ptr<application::AccessGuard> guard)
        : guard_(std::move(guard))
    {
        std::cout << "[ApiKeyMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (!guard_->isAuthorized(req.getHeader(kHeader))) {
            std::cerr << "[ApiKeyMiddleware] Unauthorized access attempt: Invalid API key ("
                      << req.getMethod() << " " << req.getPath() << ")" << std::endl;
            HttpJson::sendError(res, domain::RelayError::unauthorized("Unauthorized: Invalid API key"));
            return;
        }
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<application::AccessGuard> guard_;
};

} // namespace relay::adapters::primary
