/**
 * @file timer_queue.hpp
 * @brief Single-threaded timer service backing IScheduler in production.
 *
 * One worker thread, and a mutex plus condition variable guarding an
 * ordered queue of deadlines.
 */
#pragma once

#include "remotectl/core/interfaces/ischeduler.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <atomic>

namespace remotectl {

    /**
     * @class TimerQueue
     * @brief Runs scheduled callbacks on one dedicated worker thread.
     *
     * Callbacks are invoked without the queue lock held, so a callback may
     * schedule or cancel other timers. Exceptions escaping a callback are
     * logged and swallowed so one faulty timer cannot stop the others.
     */
    class TimerQueue : public IScheduler {
    public:
        TimerQueue();

        /**
         * @brief Stops the worker; pending timers are dropped.
         */
        ~TimerQueue() override;

        TimerQueue(const TimerQueue&) = delete;
        TimerQueue& operator=(const TimerQueue&) = delete;

        TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
        void cancel(TimerId id) override;

        /**
         * @brief Stop the worker thread and drop pending timers. Idempotent.
         *
         * Called from a timer callback (directly, or by releasing the last
         * owner of this queue), the worker is detached instead of joined and
         * exits once the callback returns.
         */
        void stop();

        /**
         * @brief Number of timers waiting to fire.
         */
        size_t pendingCount() const;

    private:
        using Key = std::pair<Clock::time_point, TimerId>;

        // Owned jointly with the worker so a queue destroyed from inside one
        // of its own callbacks leaves the worker valid state to exit on.
        struct State {
            std::map<Key, std::function<void()>>           queue;      ///< ordered by deadline, then id
            std::unordered_map<TimerId, Clock::time_point> deadlines;
            std::mutex                                     mutex;
            std::condition_variable_any                    condition;
        };

        static void workerFunction(const std::shared_ptr<State>& st, std::stop_token stoken);

        std::shared_ptr<State>                     st_;
        std::atomic<TimerId>                       nextId_{ 1 };
        std::jthread                               worker_;
    };

}
