#pragma once

#include "ports/output/ISessionStore.hpp"
#include <iostream>
#include <mutex>
#include <shared_mutex>

namespace relay::adapters::secondary {

/**
 * @brief Сессия Odoo в памяти процесса
 *
 * Одна сессия на весь процесс, последний логин побеждает.
 * Для изоляции по клиентам нужна другая реализация ISessionStore
 * (ключ клиента → токен), SessionBridge при этом не меняется.
 */
class InMemorySessionStore : public ports::output::ISessionStore {
public:
    InMemorySessionStore() {
        std::cout << "[InMemorySessionStore] Created" << std::endl;
    }

    void set(const std::string& token) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        token_ = token;
    }

    std::optional<std::string> get() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return token_;
    }

private:
    mutable std::shared_mutex mutex_;
    std::optional<std::string> token_;
};

} // namespace relay::adapters::secondary
