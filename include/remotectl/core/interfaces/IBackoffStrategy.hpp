/**
 * @file IBackoffStrategy.hpp
 * @brief Interface for reconnect backoff strategies in remotectl.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace remotectl {

    /**
     * @class IBackoffStrategy
     * @brief Computes how long to wait before a reconnect attempt.
     */
    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @brief Delay before the given attempt.
         * @param attempt Reconnect attempt number, starting from 1
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t attempt) const = 0;
    };

}
