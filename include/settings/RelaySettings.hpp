#pragma once

#include "settings/IRelaySettings.hpp"
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace relay::settings {

/**
 * @brief Настройки релея из ENV
 *
 * - API_KEY          общий секрет клиентов (обязателен)
 * - ODOO_URL         адрес Odoo по умолчанию (опционально)
 * - ALLOWED_ORIGINS  Origin через запятую (default: "https://imitrr.github.io")
 *
 * Таймаут к Odoo фиксирован: 10 секунд.
 */
class RelaySettings : public IRelaySettings {
public:
    static constexpr std::chrono::milliseconds kUpstreamTimeout{10000};

    RelaySettings()
        : apiKey_(getEnvOrDefault("API_KEY", ""))
        , defaultOdooUrl_(getEnvOrDefault("ODOO_URL", ""))
        , allowedOrigins_(splitList(getEnvOrDefault("ALLOWED_ORIGINS", "https://imitrr.github.io")))
    {
        if (apiKey_.empty()) {
            std::cerr << "[RelaySettings] WARNING: API_KEY is not set, all API requests will be rejected"
                      << std::endl;
        }
        std::cout << "[RelaySettings] ODOO_URL: "
                  << (defaultOdooUrl_.empty() ? "<per request>" : defaultOdooUrl_)
                  << ", allowed origins: " << allowedOrigins_.size() << std::endl;
    }

    std::string getApiKey() const override { return apiKey_; }
    std::string getDefaultOdooUrl() const override { return defaultOdooUrl_; }
    std::vector<std::string> getAllowedOrigins() const override { return allowedOrigins_; }
    std::chrono::milliseconds getUpstreamTimeout() const override { return kUpstreamTimeout; }

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto begin = item.find_first_not_of(" \t");
            auto end = item.find_last_not_of(" \t");
            if (begin != std::string::npos) {
                result.push_back(item.substr(begin, end - begin + 1));
            }
        }
        return result;
    }

private:
    std::string apiKey_;
    std::string defaultOdooUrl_;
    std::vector<std::string> allowedOrigins_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace relay::settings
