#pragma once

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relay::ports::output {

/**
 * @brief Ответ Odoo, полученный по HTTP
 *
 * Заголовки хранятся списком: Set-Cookie может повторяться.
 */
struct UpstreamResponse {
    int status = 0;
    std::string body;           ///< Тело как пришло
    nlohmann::json json;        ///< Разобранное тело
    std::vector<std::pair<std::string, std::string>> headers;

    bool isSuccess() const { return status >= 200 && status < 300; }

    /**
     * @brief Все значения заголовка (имя без учёта регистра)
     */
    std::vector<std::string> getHeaderValues(const std::string& name) const {
        std::vector<std::string> values;
        for (const auto& [key, value] : headers) {
            if (equalsIgnoreCase(key, name)) {
                values.push_back(value);
            }
        }
        return values;
    }

private:
    static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }
};

enum class UpstreamErrorKind {
    TRANSPORT,          ///< DNS, connection refused, TLS, обрыв
    TIMEOUT,            ///< Не уложились в таймаут
    MALFORMED_RESPONSE  ///< Тело ответа не JSON
};

inline std::string toString(UpstreamErrorKind kind) {
    switch (kind) {
        case UpstreamErrorKind::TRANSPORT: return "transport";
        case UpstreamErrorKind::TIMEOUT: return "timeout";
        case UpstreamErrorKind::MALFORMED_RESPONSE: return "malformed";
        default: return "unknown";
    }
}

/**
 * @brief Ошибка обращения к Odoo
 *
 * Для MALFORMED_RESPONSE status содержит код ответа,
 * для TRANSPORT и TIMEOUT он пустой.
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(UpstreamErrorKind kind, const std::string& message,
                  std::optional<int> status = std::nullopt,
                  std::string body = "")
        : std::runtime_error(message)
        , kind_(kind)
        , status_(status)
        , body_(std::move(body))
    {}

    UpstreamErrorKind kind() const { return kind_; }
    std::optional<int> status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    UpstreamErrorKind kind_;
    std::optional<int> status_;
    std::string body_;
};

/**
 * @brief Исходящий HTTP клиент к Odoo
 *
 * POST с JSON телом и Content-Type: application/json.
 * Ответ с любым HTTP статусом возвращается как UpstreamResponse,
 * остальное бросается как UpstreamError.
 */
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    /**
     * @param baseUrl Базовый адрес Odoo ("https://erp.example.com")
     * @param endpoint Путь ("/web/dataset/call_kw")
     * @param body JSON-RPC конверт
     * @param headers Дополнительные заголовки (Cookie)
     * @throws UpstreamError
     */
    virtual UpstreamResponse post(
        const std::string& baseUrl,
        const std::string& endpoint,
        const nlohmann::json& body,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace relay::ports::output
