#include "RelayApp.hpp"

// Settings
#include "settings/RelaySettings.hpp"
#include "settings/ServerSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include <settings/IServerSettings.hpp>

// Ports
#include "ports/input/ISessionBridge.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IUpstreamClient.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IRequestIdGenerator.hpp"

// Application
#include "application/AccessGuard.hpp"
#include "application/SessionBridge.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/BeastUpstreamClient.hpp"
#include "adapters/secondary/InMemorySessionStore.hpp"
#include "adapters/secondary/RandomRequestIdGenerator.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/MetricsMiddleware.hpp"
#include "adapters/primary/CorsMiddleware.hpp"
#include "adapters/primary/ApiKeyMiddleware.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/OdooCallHandler.hpp"
#include "adapters/primary/PreflightHandler.hpp"
#include "adapters/primary/RootHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace relay {

RelayApp::RelayApp()
{
    std::cout << "[RelayApp] Application created" << std::endl;
}

RelayApp::~RelayApp()
{
    std::cout << "[RelayApp] Application destroyed" << std::endl;
}

void RelayApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[RelayApp] Loading environment..." << std::endl;
    BoostBeastApplication::loadEnvironment(argc, argv);
    std::cout << "[RelayApp] Environment loaded" << std::endl;
}

void RelayApp::configureInjection()
{
    std::cout << "[RelayApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings
        // ====================================================================
        di::bind<IServerSettings>().to<settings::ServerSettings>().in(di::singleton),
        di::bind<settings::IRelaySettings>().to<settings::RelaySettings>().in(di::singleton),
        di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

        // ====================================================================
        // Layer 2: Secondary Adapters (Output Ports)
        // ====================================================================
        di::bind<ports::output::IUpstreamClient>()
            .to<adapters::secondary::BeastUpstreamClient>()
            .in(di::singleton),

        // Одна сессия Odoo на весь процесс
        di::bind<ports::output::ISessionStore>()
            .to<adapters::secondary::InMemorySessionStore>()
            .in(di::singleton),

        di::bind<ports::output::IRequestIdGenerator>()
            .to<adapters::secondary::RandomRequestIdGenerator>()
            .in(di::singleton),

        // ====================================================================
        // Layer 3: Application Services (Input Ports)
        // ====================================================================
        di::bind<ports::input::IMetricsService>()
            .to<application::MetricsService>()
            .in(di::singleton),

        di::bind<ports::input::ISessionBridge>()
            .to<application::SessionBridge>()
            .in(di::singleton),

        di::bind<application::AccessGuard>().in(di::singleton)
    );

    // Неверный PORT бросает исключение здесь, до старта сервера
    auto server = injector.create<std::shared_ptr<IServerSettings>>();
    std::cout << "[RelayApp] Server settings: " << server->getHost() << ":" << server->getPort() << std::endl;

    // ========================================================================
    // Layer 4: Primary Adapters (HTTP Handlers)
    // ========================================================================
    auto metrics = injector.create<std::shared_ptr<adapters::primary::MetricsMiddleware>>();
    auto cors = injector.create<std::shared_ptr<adapters::primary::CorsMiddleware>>();
    auto apiKey = injector.create<std::shared_ptr<adapters::primary::ApiKeyMiddleware>>();
    auto preflight = std::make_shared<adapters::primary::PreflightHandler>();

    registerRoute("GET", "/", std::make_shared<adapters::primary::ChainHandler>(
        metrics, std::make_shared<adapters::primary::RootHandler>()));

    registerRoute("GET", "/health", std::make_shared<adapters::primary::ChainHandler>(
        metrics, injector.create<std::shared_ptr<adapters::primary::HealthHandler>>()));

    registerRoute("GET", "/metrics", std::make_shared<adapters::primary::ChainHandler>(
        metrics, injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>()));

    registerRoute("POST", "/api/login", std::make_shared<adapters::primary::ChainHandler>(
        metrics, cors, apiKey, injector.create<std::shared_ptr<adapters::primary::LoginHandler>>()));

    registerRoute("POST", "/api/odoo", std::make_shared<adapters::primary::ChainHandler>(
        metrics, cors, apiKey, injector.create<std::shared_ptr<adapters::primary::OdooCallHandler>>()));

    registerRoute("OPTIONS", "/api/login", std::make_shared<adapters::primary::ChainHandler>(
        metrics, cors, preflight));

    registerRoute("OPTIONS", "/api/odoo", std::make_shared<adapters::primary::ChainHandler>(
        metrics, cors, preflight));

    std::cout << "[RelayApp] Configuration complete" << std::endl;
}

void RelayApp::registerRoute(const std::string& method, const std::string& path,
                             std::shared_ptr<IHttpHandler> handler)
{
    registerEndpoint(method, path, handler);
    std::cout << "  ✓ " << method << " " << path << std::endl;
}

} // namespace relay
