#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpJson.hpp"
#include "settings/IRelaySettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace relay::adapters::primary {

/**
 * @brief Middleware allow-list для браузерных Origin
 *
 * Без заголовка Origin (curl, мобильные клиенты) запрос проходит.
 * Origin из списка получает Access-Control-Allow-Origin и
 * Access-Control-Allow-Credentials, остальные: 403.
 */
class CorsMiddleware : public IHttpHandler {
public:
    explicit CorsMiddleware(std::shared_ptr<settings::IRelaySettings> settings)
        : allowedOrigins_(settings->getAllowedOrigins())
    {
        std::cout << "[CorsMiddleware] Created, " << allowedOrigins_.size() << " allowed origin(s)" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto origin = req.getHeader("Origin").value_or("");
        if (origin.empty()) {
            res.setStatus(0);
            return;
        }

        if (std::find(allowedOrigins_.begin(), allowedOrigins_.end(), origin) == allowedOrigins_.end()) {
            std::cerr << "[CorsMiddleware] Origin rejected: " << origin << std::endl;
            HttpJson::sendError(res, 403,
                "The CORS policy for this site does not allow access from the specified Origin.");
            return;
        }

        res.setHeader("Access-Control-Allow-Origin", origin);
        res.setHeader("Access-Control-Allow-Credentials", "true");
        res.setHeader("Vary", "Origin");
        res.setStatus(0);
    }

private:
    std::vector<std::string> allowedOrigins_;
};

} // namespace relay::adapters::primary
