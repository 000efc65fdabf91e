/**
 * @file auth_guard.hpp
 * @brief Failed-authentication counter with a lockout window.
 *
 * One AuthGuard protects one hosting period: it is shared by every
 * connection attempt, not kept per connection. Time is passed in so tests
 * can move the clock.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace remotectl {

    /**
     * @class AuthGuard
     * @brief Locks authentication out after too many consecutive failures.
     *
     * recordFailure() increments the counter and, once it reaches the
     * threshold, opens a lockout window. recordSuccess() resets the counter
     * but leaves an already-open window in place. Not thread-safe: the owner
     * serializes access.
     */
    class AuthGuard {
    public:
        using Clock = std::chrono::steady_clock;

        explicit AuthGuard(uint32_t maxFailures = 5,
                           std::chrono::milliseconds lockout = std::chrono::seconds(30));

        void recordFailure(Clock::time_point now = Clock::now());
        void recordSuccess();

        [[nodiscard]] bool isLockedOut(Clock::time_point now = Clock::now()) const;

        /// Time left in the lockout window, zero when not locked out.
        std::chrono::milliseconds lockoutRemaining(Clock::time_point now = Clock::now()) const;

        uint32_t failedAttempts() const noexcept { return failedAttempts_; }
        uint32_t maxFailures() const noexcept { return maxFailures_; }

        /// Forget failures and any lockout; used when a new hosting period starts.
        void reset();

    private:
        uint32_t                               maxFailures_;
        std::chrono::milliseconds              lockout_;
        uint32_t                               failedAttempts_{ 0 };
        std::optional<Clock::time_point>       lockoutUntil_;
    };

}
