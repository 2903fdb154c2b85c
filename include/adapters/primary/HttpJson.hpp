#pragma once

#include "domain/RelayError.hpp"
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace relay::adapters::primary {

/**
 * @brief Общие JSON-хелперы для handlers и middleware
 */
class HttpJson {
public:
    static void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", dump(error));
    }

    static void sendError(IResponse& res, const domain::RelayError& error) {
        res.setResult(error.status, "application/json", dump(error.toJson()));
    }

    /**
     * @brief Строковое поле объекта или "" (если нет или не строка)
     */
    static std::string stringField(const nlohmann::json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string()) {
            return "";
        }
        return it->get<std::string>();
    }

    /**
     * @brief Поле "id" запроса, если это скаляр (число, строка, bool); иначе null
     */
    static nlohmann::json correlationId(const nlohmann::json& body) {
        auto it = body.find("id");
        if (it == body.end() || !(it->is_number() || it->is_string() || it->is_boolean())) {
            return nullptr;
        }
        return *it;
    }

    // Тело Odoo может содержать невалидный UTF-8
    static std::string dump(const nlohmann::json& json) {
        return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

} // namespace relay::adapters::primary
