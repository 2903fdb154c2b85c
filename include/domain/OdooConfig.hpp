#pragma once

#include <string>

namespace relay::domain {

/**
 * @brief Параметры подключения к Odoo для логина
 *
 * Приходят в теле POST /api/login (odooConfig).
 * url может отсутствовать, тогда используется ODOO_URL.
 */
struct OdooConfig {
    std::string url;        ///< Базовый адрес Odoo ("https://erp.example.com")
    std::string db;         ///< Имя базы данных (tenant)
    std::string username;   ///< Логин пользователя Odoo
    std::string password;   ///< Пароль пользователя Odoo

    bool hasCredentials() const {
        return !db.empty() && !username.empty() && !password.empty();
    }
};

} // namespace relay::domain
