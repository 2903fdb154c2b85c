#pragma once

#include <IHttpHandler.hpp>

namespace relay::adapters::primary {

/**
 * @brief Ответ на CORS preflight (OPTIONS)
 *
 * Origin уже проверен CorsMiddleware.
 */
class PreflightHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        res.setStatus(204);
        res.setHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.setHeader("Access-Control-Allow-Headers", "Content-Type, X-API-Key");
        res.setHeader("Access-Control-Max-Age", "600");
        res.setBody("");
    }
};

} // namespace relay::adapters::primary
