/**
 * @file liveness_monitor.hpp
 * @brief Periodic keep-alive pings on the controller side.
 */
#pragma once
#include "remotectl/core/interfaces/ischeduler.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace remotectl {

    /**
     * @class LivenessMonitor
     * @brief Sends a ping every interval while the connection is up.
     *
     * Liveness is advisory: it keeps proxies and NATs from dropping an idle
     * connection and does not declare the peer dead when pongs are missing.
     * Each tick checks the connected predicate before pinging and re-arms
     * itself; stop() cancels the pending tick.
     */
    class LivenessMonitor {
    public:
        using PingFn = std::function<void()>;
        using ConnectedFn = std::function<bool()>;

        LivenessMonitor(IScheduler& scheduler,
                        std::chrono::milliseconds interval,
                        PingFn sendPing,
                        ConnectedFn isConnected);
        ~LivenessMonitor();

        LivenessMonitor(const LivenessMonitor&) = delete;
        LivenessMonitor& operator=(const LivenessMonitor&) = delete;

        /// Restarts the period when already running.
        void start();
        void stop();

        bool isRunning() const;

        /// Pings sent since construction.
        uint64_t pingsSent() const;

    private:
        // Shared with pending timer callbacks so a tick that races the
        // destructor touches live memory.
        struct State {
            State(IScheduler& s, std::chrono::milliseconds i, PingFn p, ConnectedFn c)
                : scheduler(s), interval(i), sendPing(std::move(p)), isConnected(std::move(c)) {}

            IScheduler&               scheduler;
            std::chrono::milliseconds interval;
            PingFn                    sendPing;
            ConnectedFn               isConnected;

            std::mutex                mx;
            TimerId                   timer{ 0 };
            uint64_t                  generation{ 0 };   ///< bumped by start/stop so stale ticks are ignored
            bool                      running{ false };
            uint64_t                  pingsSent{ 0 };
        };

        static void arm(const std::shared_ptr<State>& st);
        static void onTick(const std::shared_ptr<State>& st, uint64_t generation);

        std::shared_ptr<State> st_;
    };

}
