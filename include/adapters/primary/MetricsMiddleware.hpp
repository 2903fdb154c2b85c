#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMetricsService.hpp"
#include <memory>

namespace relay::adapters::primary {

/**
 * @brief Middleware: http_requests_total{method="...",path="..."}
 *
 * Считает входящие запросы до обработки. Метка path берётся из
 * зарегистрированного маршрута, а не из пути запроса.
 */
class MetricsMiddleware : public IHttpHandler {
public:
    explicit MetricsMiddleware(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                    {"path", req.getPathPattern()}});
        res.setStatus(0);
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace relay::adapters::primary
