#include "RelayApp.hpp"
#include "utils/ShutdownSignals.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        relay::RelayApp app;

        // SIGINT/SIGTERM обрабатываются в своём потоке, не в signal handler
        relay::utils::ShutdownSignals signals([&app](int) { app.stop(); });

        std::cout << "========================================" << std::endl;
        std::cout << "  Odoo Relay v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        std::cout << "[main] Odoo Relay stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
