#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <functional>
#include <iostream>
#include <thread>

namespace relay::utils {

/**
 * @brief Ожидание SIGINT/SIGTERM в отдельном потоке
 *
 * Сигнал ловит boost::asio::signal_set, поэтому onSignal вызывается
 * в обычном потоке, а не в обработчике сигнала: в нём можно писать
 * в лог и останавливать сервер. onSignal вызывается не больше одного раза.
 */
class ShutdownSignals {
public:
    explicit ShutdownSignals(std::function<void(int)> onSignal)
        : signals_(ioc_, SIGINT, SIGTERM)
        , onSignal_(std::move(onSignal))
    {
        signals_.async_wait([this](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            std::cout << "\n[ShutdownSignals] Received signal " << signal << ", shutting down..." << std::endl;
            onSignal_(signal);
        });
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~ShutdownSignals() {
        ioc_.stop();
        thread_.join();
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

private:
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::function<void(int)> onSignal_;
    std::thread thread_;
};

} // namespace relay::utils
