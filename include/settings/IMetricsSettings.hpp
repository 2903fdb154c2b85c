#pragma once

#include <string>
#include <vector>

namespace relay::settings {

/**
 * @brief Описание метрики для HELP и TYPE строк Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< "relay_logins_total"
    std::string help;   ///< Текст для # HELP
    std::string type;   ///< "counter"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * Набор ключей фиксирован заранее: MetricsService заводит их нулями,
 * чтобы /metrics сразу отдавал полный список счётчиков.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @brief Все ключи вида name{label="value",...} в порядке вывода
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace relay::settings
