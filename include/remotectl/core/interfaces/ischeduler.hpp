/**
 * @file ischeduler.hpp
 * @brief Timer capability consumed by the session engine.
 */
#pragma once
#include "remotectl/core/types.hpp"
#include <chrono>
#include <functional>

namespace remotectl {

    /**
     * @class IScheduler
     * @brief One-shot timers plus the clock they run on.
     *
     * Callbacks run on a thread owned by the scheduler, never inside
     * schedule() or cancel(). Cancelling an id that already fired or was
     * never issued is a no-op.
     */
    class IScheduler {
    public:
        using Clock = std::chrono::steady_clock;

        virtual ~IScheduler() = default;

        /**
         * @brief Run @p fn once after @p delay.
         * @return Handle usable with cancel()
         */
        virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

        /**
         * @brief Prevent a pending timer from firing.
         */
        virtual void cancel(TimerId id) = 0;

        /**
         * @brief Current time on the scheduler's clock.
         */
        virtual Clock::time_point now() const { return Clock::now(); }
    };

}
