#pragma once

#include "ports/output/IRequestIdGenerator.hpp"
#include <random>

namespace relay::adapters::secondary {

/**
 * @brief Случайный correlation id в диапазоне [1, 1'000'000'000]
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class RandomRequestIdGenerator : public ports::output::IRequestIdGenerator {
public:
    int64_t next() override {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<int64_t> dist(1, 1000000000);
        return dist(gen);
    }
};

} // namespace relay::adapters::secondary
