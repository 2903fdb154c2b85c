#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace relay::utils {

/**
 * @brief Дать отменённым операциям io_context завершиться, не дольше grace
 *
 * resolver.cancel() не прерывает getaddrinfo, который уже выполняется.
 * Если за grace io_context не опустел, он дорабатывает в фоновом потоке.
 * Поток держит owner (владельца io_context и всего, на что ссылаются
 * handlers) и освобождает его, когда последний handler отработал.
 *
 * @return true, если всё завершилось в пределах grace
 */
template <class Owner>
bool drainOrHandOff(std::shared_ptr<Owner> owner, boost::asio::io_context& ioc,
                    std::chrono::milliseconds grace) {
    ioc.restart();
    ioc.run_for(grace);
    if (ioc.stopped()) {
        return true;
    }

    std::thread([owner = std::move(owner), &ioc]() mutable {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            std::cerr << "[AsioDrain] Background cleanup failed: " << e.what() << std::endl;
        }
        owner.reset();
    }).detach();
    return false;
}

} // namespace relay::utils
