#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace relay::settings {

/**
 * @brief Интерфейс настроек релея
 */
class IRelaySettings {
public:
    virtual ~IRelaySettings() = default;

    /**
     * @brief Общий секрет для заголовка X-API-Key
     * @return Пустая строка, если API_KEY не задан
     */
    virtual std::string getApiKey() const = 0;

    /**
     * @brief Адрес Odoo по умолчанию (ODOO_URL)
     *
     * Используется, когда клиент не прислал odooConfig.url.
     */
    virtual std::string getDefaultOdooUrl() const = 0;

    /**
     * @brief Разрешённые Origin браузерных клиентов
     */
    virtual std::vector<std::string> getAllowedOrigins() const = 0;

    /**
     * @brief Таймаут одного запроса к Odoo
     */
    virtual std::chrono::milliseconds getUpstreamTimeout() const = 0;
};

} // namespace relay::settings
