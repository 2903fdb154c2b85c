#pragma once

#include "domain/enums/ErrorKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace relay::domain {

/**
 * @brief Ошибка релея с HTTP статусом для клиента
 *
 * Сериализуется в { "error": message, "details": details }.
 * details опускается, если null.
 */
struct RelayError {
    ErrorKind kind = ErrorKind::NONE;
    int status = 500;
    std::string message;
    nlohmann::json details;

    RelayError() = default;

    RelayError(ErrorKind kind, int status, std::string message,
               nlohmann::json details = nullptr)
        : kind(kind)
        , status(status)
        , message(std::move(message))
        , details(std::move(details))
    {}

    static RelayError unauthorized(const std::string& message) {
        return {ErrorKind::UNAUTHORIZED, 403, message};
    }

    static RelayError invalidInput(const std::string& message) {
        return {ErrorKind::INVALID_INPUT, 400, message};
    }

    static RelayError serverMisconfigured(const std::string& message) {
        return {ErrorKind::SERVER_MISCONFIGURED, 400, message};
    }

    static RelayError noActiveSession() {
        return {ErrorKind::NO_ACTIVE_SESSION, 401,
                "Unauthorized: No active Odoo session. Please log in."};
    }

    static RelayError authenticationFailed(const std::string& message,
                                           nlohmann::json details = nullptr) {
        return {ErrorKind::AUTHENTICATION_FAILED, 401, message, std::move(details)};
    }

    static RelayError upstreamRejected(int status, const std::string& message,
                                       nlohmann::json details = nullptr) {
        return {ErrorKind::UPSTREAM_REJECTED, status, message, std::move(details)};
    }

    static RelayError upstreamUnavailable(const std::string& message,
                                          const std::string& details) {
        return {ErrorKind::UPSTREAM_UNAVAILABLE, 500, message, details};
    }

    static RelayError upstreamMalformed(const std::string& message,
                                        nlohmann::json details = nullptr) {
        return {ErrorKind::UPSTREAM_MALFORMED, 500, message, std::move(details)};
    }

    nlohmann::json toJson() const {
        nlohmann::json body;
        body["error"] = message;
        if (!details.is_null()) {
            body["details"] = details;
        }
        return body;
    }
};

} // namespace relay::domain
