#include "remotectl/core/liveness/liveness_monitor.hpp"
#include "remotectl/core/util/logger.hpp"
#include <string>

namespace remotectl {

    LivenessMonitor::LivenessMonitor(IScheduler& scheduler,
                                     std::chrono::milliseconds interval,
                                     PingFn sendPing,
                                     ConnectedFn isConnected)
        : st_(std::make_shared<State>(scheduler, interval, std::move(sendPing), std::move(isConnected))) {}

    LivenessMonitor::~LivenessMonitor() {
        stop();
    }

    void LivenessMonitor::start() {
        std::lock_guard<std::mutex> lk(st_->mx);
        if (st_->timer) st_->scheduler.cancel(st_->timer);
        ++st_->generation;
        st_->running = true;
        arm(st_);
        LOG_DEBUG("LivenessMonitor: started, interval " + std::to_string(st_->interval.count()) + "ms");
    }

    void LivenessMonitor::stop() {
        std::lock_guard<std::mutex> lk(st_->mx);
        if (!st_->running) return;
        if (st_->timer) st_->scheduler.cancel(st_->timer);
        st_->timer = 0;
        ++st_->generation;
        st_->running = false;
        LOG_DEBUG("LivenessMonitor: stopped");
    }

    bool LivenessMonitor::isRunning() const {
        std::lock_guard<std::mutex> lk(st_->mx);
        return st_->running;
    }

    uint64_t LivenessMonitor::pingsSent() const {
        std::lock_guard<std::mutex> lk(st_->mx);
        return st_->pingsSent;
    }

    // st->mx held
    void LivenessMonitor::arm(const std::shared_ptr<State>& st) {
        const uint64_t gen = st->generation;
        std::weak_ptr<State> weak = st;
        st->timer = st->scheduler.schedule(st->interval, [weak, gen] {
            if (auto s = weak.lock()) onTick(s, gen);
        });
    }

    void LivenessMonitor::onTick(const std::shared_ptr<State>& st, uint64_t generation) {
        {
            std::lock_guard<std::mutex> lk(st->mx);
            if (!st->running || generation != st->generation) return;
            st->timer = 0;
        }

        // outside the lock: sending re-enters the owning peer, which may stop us
        if (st->isConnected && st->isConnected()) {
            if (st->sendPing) st->sendPing();
            std::lock_guard<std::mutex> lk(st->mx);
            ++st->pingsSent;
        }

        std::lock_guard<std::mutex> lk(st->mx);
        if (st->running && generation == st->generation) arm(st);
    }

}
