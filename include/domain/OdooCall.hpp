#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace relay::domain {

/**
 * @brief Вызов метода модели Odoo (call_kw)
 *
 * Строится из тела POST /api/odoo, нигде не сохраняется.
 */
struct OdooCall {
    std::string url;                                   ///< Адрес Odoo (может быть пустым)
    std::string model;                                 ///< "res.partner"
    std::string method;                                ///< "search_read"
    nlohmann::json args = nlohmann::json::array();     ///< Позиционные аргументы
    nlohmann::json kwargs = nlohmann::json::object();  ///< Именованные аргументы
    nlohmann::json id;                                 ///< Correlation id (null = сгенерировать)
};

} // namespace relay::domain
