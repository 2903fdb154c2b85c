#pragma once

#include <map>
#include <string>

namespace relay::ports::input {

/**
 * @brief Интерфейс сервиса метрик (только counter)
 *
 * @example
 * ```cpp
 * metrics->increment("relay_logins_total", {{"outcome", "success"}});
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1
     *
     * Ключ: name{label1="value1",label2="value2"}, labels отсортированы по имени.
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace relay::ports::input
