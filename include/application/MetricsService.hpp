#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

namespace relay::application {

/**
 * @brief Счётчики Prometheus для релея
 *
 * Набор ключей из IMetricsSettings строится один раз в конструкторе
 * и дальше не меняется, поэтому инкремент известного ключа идёт без
 * блокировок (atomic fetch_add).
 *
 * Ключи вне набора (например, метрика с новой меткой) не хранятся:
 * растёт только общий счётчик отброшенных, предупреждение пишется один раз.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_.try_emplace(key, 0);
        }
        std::cout << "[MetricsService] Initialized with " << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        auto key = buildKey(name, labels);

        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0) {
            std::cerr << "[MetricsService] WARNING: unregistered metric " << key
                      << " dropped (further drops are counted silently)" << std::endl;
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        auto keys = settings_->getAllKeys();
        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            for (const auto& key : keys) {
                if (metricName(key) != def.name) {
                    continue;
                }
                oss << key << " " << counters_.at(key).load(std::memory_order_relaxed) << "\n";
            }
        }
        return oss.str();
    }

    /**
     * @brief Текущее значение счётчика (0 для незарегистрированного ключа)
     */
    int64_t value(const std::string& name, const std::map<std::string, std::string>& labels = {}) const {
        auto key = buildKey(name, labels);

        auto it = counters_.find(key);
        if (it != counters_.end()) {
            return it->second.load(std::memory_order_relaxed);
        }
        return 0;
    }

    int64_t droppedCount() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;

    // заполняется только в конструкторе
    std::map<std::string, std::atomic<int64_t>> counters_;

    std::atomic<int64_t> dropped_{0};

    static std::string metricName(const std::string& key) {
        return key.substr(0, key.find('{'));
    }

    // name{a="1",b="2"}: метки по алфавиту, " и \ экранируются
    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) {
                key += ',';
            }
            key += it->first + "=\"";
            for (char c : it->second) {
                if (c == '"' || c == '\\') {
                    key += '\\';
                }
                key += c;
            }
            key += '"';
        }
        key += '}';
        return key;
    }
};

} // namespace relay::application
