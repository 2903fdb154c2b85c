#pragma once

#include <IHttpHandler.hpp>

namespace relay::adapters::primary {

/**
 * @brief GET / - информационная страница
 */
class RootHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        res.setResult(200, "text/html; charset=utf-8",
            "<h1>Odoo Relay Server Running</h1>\n"
            "<p>Available endpoints:</p>\n"
            "<ul>\n"
            "  <li>POST /api/login</li>\n"
            "  <li>POST /api/odoo</li>\n"
            "  <li>GET /health</li>\n"
            "  <li>GET /metrics</li>\n"
            "</ul>\n");
    }
};

} // namespace relay::adapters::primary
