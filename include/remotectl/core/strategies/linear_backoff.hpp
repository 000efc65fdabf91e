/**
 * @file linear_backoff.hpp
 * @brief Linear backoff: base * attempt, capped at max.
 */
#pragma once
#include "remotectl/core/interfaces/IBackoffStrategy.hpp"
#include <chrono>

namespace remotectl {

    /**
     * @class LinearBackoff
     * @brief Reconnect delay growing by a fixed step per attempt.
     */
    class LinearBackoff : public IBackoffStrategy {
    public:
        LinearBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            auto d = base_ * (attempt == 0 ? 1 : attempt);
            return d < max_ ? d : max_;
        }
    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

}
