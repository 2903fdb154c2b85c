#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpJson.hpp"
#include <iostream>
#include <memory>
#include <vector>

namespace relay::adapters::primary {

/**
 * @brief Цепочка middleware + handler
 *
 * Middleware, пропускающий запрос дальше, выставляет статус 0.
 * Первый ненулевой статус завершает цепочку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        // дошли до конца со статусом 0: последний handler ничего не ответил
        std::cerr << "[ChainHandler] Error: chain finished, but HTTP status is zero" << std::endl;
        HttpJson::sendError(res, 500, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace relay::adapters::primary
