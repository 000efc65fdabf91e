#include "remotectl/core/auth/auth_guard.hpp"
#include "remotectl/core/util/logger.hpp"
#include <string>

namespace remotectl {

    AuthGuard::AuthGuard(uint32_t maxFailures, std::chrono::milliseconds lockout)
        : maxFailures_(maxFailures == 0 ? 1 : maxFailures), lockout_(lockout) {}

    void AuthGuard::recordFailure(Clock::time_point now) {
        ++failedAttempts_;
        if (failedAttempts_ >= maxFailures_) {
            lockoutUntil_ = now + lockout_;
            LOG_WARN("AuthGuard: " + std::to_string(failedAttempts_) +
                     " failed attempts, locked out for " +
                     std::to_string(lockout_.count()) + "ms");
        }
    }

    void AuthGuard::recordSuccess() {
        failedAttempts_ = 0;
    }

    bool AuthGuard::isLockedOut(Clock::time_point now) const {
        return lockoutUntil_ && now < *lockoutUntil_;
    }

    std::chrono::milliseconds AuthGuard::lockoutRemaining(Clock::time_point now) const {
        if (!isLockedOut(now)) return std::chrono::milliseconds::zero();
        return std::chrono::duration_cast<std::chrono::milliseconds>(*lockoutUntil_ - now);
    }

    void AuthGuard::reset() {
        failedAttempts_ = 0;
        lockoutUntil_.reset();
    }

}
