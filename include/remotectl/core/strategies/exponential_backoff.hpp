/**
 * @file exponential_backoff.hpp
 * @brief Doubling backoff: base, 2*base, 4*base ... capped at max.
 */
#pragma once
#include "remotectl/core/interfaces/IBackoffStrategy.hpp"
#include <algorithm>

namespace remotectl {

    /**
     * @class ExponentialBackoff
     * @brief Default reconnect strategy of the SessionController (1 s, 2 s, 4 s, 8 s, 16 s).
     */
    class ExponentialBackoff : public IBackoffStrategy {
    public:
        ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            if (attempt == 0) attempt = 1;
            uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
            long long delay = static_cast<long long>(base_.count()) * (1LL << shift);
            delay = std::min(delay, static_cast<long long>(max_.count()));
            return std::chrono::milliseconds(delay);
        }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

}
