#pragma once

#include <string>

namespace relay::domain {

/**
 * @brief Вид ошибки, видимой клиенту релея
 */
enum class ErrorKind {
    NONE,
    UNAUTHORIZED,           ///< Неверный или отсутствующий X-API-Key
    INVALID_INPUT,          ///< Не хватает обязательных полей
    SERVER_MISCONFIGURED,   ///< Нет ODOO_URL и url в запросе
    NO_ACTIVE_SESSION,      ///< Вызов без предварительного логина
    AUTHENTICATION_FAILED,  ///< Odoo отклонил логин (error envelope)
    UPSTREAM_REJECTED,      ///< Odoo ответил не-2xx
    UPSTREAM_UNAVAILABLE,   ///< Таймаут, DNS, connection refused
    UPSTREAM_MALFORMED      ///< Тело ответа Odoo не разобрать
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::UNAUTHORIZED: return "UNAUTHORIZED";
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::SERVER_MISCONFIGURED: return "SERVER_MISCONFIGURED";
        case ErrorKind::NO_ACTIVE_SESSION: return "NO_ACTIVE_SESSION";
        case ErrorKind::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case ErrorKind::UPSTREAM_REJECTED: return "UPSTREAM_REJECTED";
        case ErrorKind::UPSTREAM_UNAVAILABLE: return "UPSTREAM_UNAVAILABLE";
        case ErrorKind::UPSTREAM_MALFORMED: return "UPSTREAM_MALFORMED";
    }
    return "UNKNOWN";
}

} // namespace relay::domain
