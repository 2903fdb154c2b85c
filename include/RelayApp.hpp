#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <memory>
#include <string>

namespace relay {

/**
 * @brief Odoo Relay Application
 *
 * Template Method из BoostBeastApplication:
 * 1. loadEnvironment() - config.json + ENV (API_KEY, ODOO_URL, PORT, ...)
 * 2. configureInjection() - Boost.DI и регистрация endpoints
 * 3. start() - HTTP сервер
 *
 * Endpoints:
 * - GET  /             информационная страница
 * - GET  /health       состояние релея
 * - GET  /metrics      Prometheus
 * - POST /api/login    логин в Odoo (X-API-Key)
 * - POST /api/odoo     call_kw в Odoo (X-API-Key)
 * - OPTIONS /api/*     CORS preflight
 */
class RelayApp : public BoostBeastApplication {
public:
    RelayApp();
    ~RelayApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;
    void configureInjection() override;

private:
    void registerRoute(const std::string& method, const std::string& path,
                       std::shared_ptr<IHttpHandler> handler);
};

} // namespace relay
