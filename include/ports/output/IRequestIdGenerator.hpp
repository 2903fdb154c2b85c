#pragma once

#include <cstdint>

namespace relay::ports::output {

/**
 * @brief Генератор correlation id для JSON-RPC конверта
 */
class IRequestIdGenerator {
public:
    virtual ~IRequestIdGenerator() = default;

    virtual int64_t next() = 0;
};

} // namespace relay::ports::output
