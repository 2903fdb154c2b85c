#pragma once

#include "ports/output/IUpstreamClient.hpp"
#include "settings/IRelaySettings.hpp"
#include "utils/UpstreamUrl.hpp"
#include <chrono>
#include <cstddef>
#include <memory>

namespace relay::adapters::secondary {

/**
 * @brief HTTP(S) клиент к Odoo на Boost.Beast
 *
 * Каждый вызов открывает новое соединение (без пула).
 * Общий дедлайн на resolve, connect, TLS handshake, запись и чтение
 * берётся из IRelaySettings::getUpstreamTimeout().
 *
 * Для https проверяется сертификат и имя хоста (системные CA).
 *
 * По дедлайну post() бросает TIMEOUT сразу после kCancelGrace, даже если
 * getaddrinfo ещё не вернулся: очистка доделывается в фоне.
 */
class BeastUpstreamClient : public ports::output::IUpstreamClient {
public:
    static constexpr std::size_t kBodyLimit = 64 * 1024 * 1024;
    static constexpr std::chrono::milliseconds kCancelGrace{100};

    explicit BeastUpstreamClient(std::shared_ptr<settings::IRelaySettings> settings);

    ports::output::UpstreamResponse post(
        const std::string& baseUrl,
        const std::string& endpoint,
        const nlohmann::json& body,
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    std::shared_ptr<settings::IRelaySettings> settings_;
};

} // namespace relay::adapters::secondary
