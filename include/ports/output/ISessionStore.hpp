#pragma once

#include <optional>
#include <string>

namespace relay::ports::output {

/**
 * @brief Хранилище сессии Odoo
 *
 * Держит не больше одного токена (значение для заголовка Cookie).
 * Новый set() полностью заменяет предыдущий токен.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    virtual void set(const std::string& token) = 0;
    virtual std::optional<std::string> get() const = 0;
};

} // namespace relay::ports::output
