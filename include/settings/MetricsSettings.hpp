#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace relay::settings {

/**
 * @brief Настройки метрик релея
 *
 * - HTTP метрики (все зарегистрированные endpoints)
 * - Логины и проксированные вызовы (success / failure)
 * - Ошибки обращения к Odoo по видам
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"relay_logins_total", "Odoo logins performed through the relay", "counter"},
            {"relay_calls_total", "Odoo call_kw requests forwarded by the relay", "counter"},
            {"relay_upstream_errors_total", "Failed requests to Odoo by failure kind", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            "http_requests_total{method=\"GET\",path=\"/\"}",
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"POST\",path=\"/api/login\"}",
            "http_requests_total{method=\"POST\",path=\"/api/odoo\"}",
            "http_requests_total{method=\"OPTIONS\",path=\"/api/login\"}",
            "http_requests_total{method=\"OPTIONS\",path=\"/api/odoo\"}",

            "relay_logins_total{outcome=\"success\"}",
            "relay_logins_total{outcome=\"failure\"}",
            "relay_calls_total{outcome=\"success\"}",
            "relay_calls_total{outcome=\"failure\"}",

            "relay_upstream_errors_total{kind=\"transport\"}",
            "relay_upstream_errors_total{kind=\"timeout\"}",
            "relay_upstream_errors_total{kind=\"malformed\"}",
            "relay_upstream_errors_total{kind=\"rejected\"}"
        };
    }
};

} // namespace relay::settings
