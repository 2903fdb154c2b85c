#pragma once

#include "settings/IRelaySettings.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace relay::application {

/**
 * @brief Проверка общего секрета клиента (X-API-Key)
 *
 * Ключ должен побайтно совпасть с API_KEY.
 * Пустой API_KEY не совпадает ни с чем.
 */
class AccessGuard {
public:
    explicit AccessGuard(std::shared_ptr<settings::IRelaySettings> settings)
        : apiKey_(settings->getApiKey())
    {
        std::cout << "[AccessGuard] Created" << std::endl;
    }

    bool isAuthorized(const std::optional<std::string>& clientKey) const {
        if (!clientKey || apiKey_.empty()) {
            return false;
        }
        return constantTimeEquals(*clientKey, apiKey_);
    }

private:
    std::string apiKey_;

    // Время сравнения не зависит от позиции первого несовпадения
    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (std::size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }
};

} // namespace relay::application
