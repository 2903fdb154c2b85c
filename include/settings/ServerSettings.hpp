#pragma once

#include <settings/IServerSettings.hpp>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace relay::settings {

/**
 * @brief Настройки HTTP сервера релея
 *
 * Читает из ENV:
 * - HOST (default: "0.0.0.0")
 * - PORT (default: 3000)
 */
class ServerSettings : public IServerSettings {
public:
    ServerSettings() {
        if (const char* host = std::getenv("HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("PORT")) {
            port_ = parsePort(port);
        }
    }

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 3000;

    static uint16_t parsePort(const std::string& value) {
        size_t pos = 0;
        int port = 0;
        try {
            port = std::stoi(value, &pos);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid PORT: " + value);
        }
        if (pos != value.size() || port <= 0 || port > 65535) {
            throw std::runtime_error("Invalid PORT: " + value);
        }
        return static_cast<uint16_t>(port);
    }
};

} // namespace relay::settings
