/**
 * @file timer_queue.cpp
 * @brief Implementation of the TimerQueue class.
 */
#include "remotectl/core/util/timer_queue.hpp"
#include "remotectl/core/util/logger.hpp"
#include <string>

namespace remotectl {

    TimerQueue::TimerQueue()
        : st_(std::make_shared<State>()) {
        worker_ = std::jthread([st = st_](std::stop_token stoken) { workerFunction(st, stoken); });
    }

    TimerQueue::~TimerQueue() {
        stop();
    }

    TimerId TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
        TimerId id = nextId_.fetch_add(1, std::memory_order_relaxed);
        auto deadline = Clock::now() + delay;
        {
            std::lock_guard<std::mutex> lock(st_->mutex);
            st_->queue.emplace(Key{ deadline, id }, std::move(fn));
            st_->deadlines.emplace(id, deadline);
        }
        st_->condition.notify_one();
        return id;
    }

    void TimerQueue::cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(st_->mutex);
        auto it = st_->deadlines.find(id);
        if (it == st_->deadlines.end()) return;
        st_->queue.erase(Key{ it->second, id });
        st_->deadlines.erase(it);
    }

    void TimerQueue::stop() {
        if (worker_.joinable()) {
            worker_.request_stop();
            st_->condition.notify_all();
            if (worker_.get_id() == std::this_thread::get_id()) {
                LOG_DEBUG("TimerQueue: stopped from its own worker, detaching");
                worker_.detach();
            } else {
                worker_.join();
            }
        }
        std::lock_guard<std::mutex> lock(st_->mutex);
        st_->queue.clear();
        st_->deadlines.clear();
    }

    size_t TimerQueue::pendingCount() const {
        std::lock_guard<std::mutex> lock(st_->mutex);
        return st_->queue.size();
    }

    void TimerQueue::workerFunction(const std::shared_ptr<State>& st, std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(st->mutex);
        while (!stoken.stop_requested()) {
            if (st->queue.empty()) {
                st->condition.wait(lock, stoken, [&st] { return !st->queue.empty(); });
                continue;
            }

            const auto deadline = st->queue.begin()->first.first;
            if (Clock::now() < deadline) {
                // wake early when an earlier timer is inserted or the head is cancelled
                st->condition.wait_until(lock, stoken, deadline, [&st, deadline] {
                    return st->queue.empty() || st->queue.begin()->first.first != deadline;
                });
                continue;
            }

            std::function<void()> fn;
            {
                auto node = st->queue.extract(st->queue.begin());
                st->deadlines.erase(node.key().second);
                fn = std::move(node.mapped());
            }
            lock.unlock();
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR("TimerQueue: timer callback threw: " + std::string(e.what()));
            }
            // captures may own this queue; release them unlocked
            fn = nullptr;
            lock.lock();
        }
    }

}
