#pragma once

#include "domain/OdooCall.hpp"
#include "domain/OdooConfig.hpp"
#include "domain/RelayError.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace relay::ports::input {

/**
 * @brief Результат логина в Odoo
 */
struct LoginResult {
    bool success = false;
    nlohmann::json uid;         ///< uid пользователя Odoo
    domain::RelayError error;   ///< Заполнен при success == false
};

/**
 * @brief Результат проксированного вызова
 */
struct CallResult {
    bool success = false;
    std::string body;           ///< Тело ответа Odoo без изменений
    domain::RelayError error;
};

/**
 * @brief Мост между клиентом и сессией Odoo
 *
 * Логинится в Odoo, запоминает cookie сессии и подставляет её
 * во все последующие вызовы.
 */
class ISessionBridge {
public:
    virtual ~ISessionBridge() = default;

    /**
     * @brief POST <url>/web/session/authenticate
     * @param config Адрес и учётные данные Odoo
     * @param id Correlation id (null = сгенерировать)
     */
    virtual LoginResult login(const domain::OdooConfig& config, const nlohmann::json& id) = 0;

    /**
     * @brief POST <url>/web/dataset/call_kw с cookie текущей сессии
     */
    virtual CallResult call(const domain::OdooCall& call) = 0;

    virtual bool hasActiveSession() const = 0;
};

} // namespace relay::ports::input
