#include <catch2/catch_all.hpp>
#include "internal/core/util/random.hpp"
#include "remotectl/core/strategies/exponential_backoff.hpp"
#include "remotectl/core/strategies/linear_backoff.hpp"
#include "remotectl/core/util/timer_queue.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace remotectl;
using namespace std::chrono_literals;

TEST_CASE("generateSessionId: 8 upper-case alphanumerics", "[util][random]") {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generateSessionId();
        REQUIRE(id.size() == 8);
        REQUIRE(std::all_of(id.begin(), id.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'A' && c <= 'Z');
        }));
        seen.insert(id);
    }
    // 36^8 ids: a collision within 200 draws would point at a broken generator
    REQUIRE(seen.size() == 200);
}

TEST_CASE("generatePin: 6 digits", "[util][random]") {
    for (int i = 0; i < 200; ++i) {
        auto pin = generatePin();
        REQUIRE(pin.size() == 6);
        REQUIRE(std::all_of(pin.begin(), pin.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        }));
    }
}

TEST_CASE("randomBelow stays in range and covers it", "[util][random]") {
    std::set<uint32_t> seen;
    for (int i = 0; i < 2000; ++i) {
        auto v = randomBelow(10);
        REQUIRE(v < 10);
        seen.insert(v);
    }
    REQUIRE(seen.size() == 10);
    REQUIRE(randomBelow(0) == 0);
    REQUIRE(randomBelow(1) == 0);
}

TEST_CASE("ExponentialBackoff doubles up to the cap", "[util][backoff]") {
    ExponentialBackoff b(1s, 16s);
    REQUIRE(b.nextDelay(1) == 1s);
    REQUIRE(b.nextDelay(2) == 2s);
    REQUIRE(b.nextDelay(3) == 4s);
    REQUIRE(b.nextDelay(5) == 16s);
    REQUIRE(b.nextDelay(6) == 16s);
    REQUIRE(b.nextDelay(100) == 16s);
    REQUIRE(b.nextDelay(0) == 1s);
}

TEST_CASE("LinearBackoff grows by the base up to the cap", "[util][backoff]") {
    LinearBackoff b(500ms, 2s);
    REQUIRE(b.nextDelay(1) == 500ms);
    REQUIRE(b.nextDelay(3) == 1500ms);
    REQUIRE(b.nextDelay(4) == 2s);
    REQUIRE(b.nextDelay(9) == 2s);
}

TEST_CASE("TimerQueue fires callbacks in deadline order", "[util][timer]") {
    TimerQueue q;
    std::mutex mx;
    std::vector<int> order;
    std::promise<void> done;

    q.schedule(60ms, [&] {
        std::lock_guard<std::mutex> lk(mx);
        order.push_back(3);
        done.set_value();
    });
    q.schedule(20ms, [&] { std::lock_guard<std::mutex> lk(mx); order.push_back(1); });
    q.schedule(40ms, [&] { std::lock_guard<std::mutex> lk(mx); order.push_back(2); });

    REQUIRE(done.get_future().wait_for(2s) == std::future_status::ready);
    std::lock_guard<std::mutex> lk(mx);
    REQUIRE(order == std::vector<int>{ 1, 2, 3 });
}

TEST_CASE("TimerQueue cancel prevents a callback", "[util][timer]") {
    TimerQueue q;
    std::atomic_bool cancelledRan{ false };
    std::promise<void> done;

    auto id = q.schedule(30ms, [&] { cancelledRan = true; });
    q.schedule(80ms, [&] { done.set_value(); });
    q.cancel(id);
    q.cancel(id);
    q.cancel(9999);

    REQUIRE(done.get_future().wait_for(2s) == std::future_status::ready);
    REQUIRE_FALSE(cancelledRan);
    REQUIRE(q.pendingCount() == 0);
}

TEST_CASE("TimerQueue callbacks may schedule more timers and survive exceptions", "[util][timer]") {
    TimerQueue q;
    std::promise<void> done;

    q.schedule(10ms, [] { throw std::runtime_error("faulty timer"); });
    q.schedule(20ms, [&] {
        q.schedule(10ms, [&] { done.set_value(); });
    });

    REQUIRE(done.get_future().wait_for(2s) == std::future_status::ready);
}

TEST_CASE("TimerQueue stop drops pending timers", "[util][timer]") {
    TimerQueue q;
    std::atomic_bool ran{ false };
    q.schedule(10s, [&] { ran = true; });
    REQUIRE(q.pendingCount() == 1);

    q.stop();
    REQUIRE(q.pendingCount() == 0);
    REQUIRE_FALSE(ran);
    q.stop();
}

TEST_CASE("TimerQueue can be stopped from its own callback", "[util][timer]") {
    TimerQueue q;
    std::promise<void> done;
    std::atomic_bool laterRan{ false };

    q.schedule(10ms, [&] {
        q.stop();
        done.set_value();
    });
    q.schedule(50ms, [&] { laterRan = true; });

    REQUIRE(done.get_future().wait_for(2s) == std::future_status::ready);
    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(laterRan);
    REQUIRE(q.pendingCount() == 0);
}

TEST_CASE("TimerQueue survives losing its last owner inside a callback", "[util][timer]") {
    std::promise<void> done;
    auto queue = std::make_shared<TimerQueue>();
    std::weak_ptr<TimerQueue> weak = queue;
    auto owner = std::make_shared<std::shared_ptr<TimerQueue>>(std::move(queue));

    (*owner)->schedule(10ms, [owner, &done] {
        // the queue is destroyed on its own worker thread here
        owner->reset();
        done.set_value();
    });

    REQUIRE(done.get_future().wait_for(2s) == std::future_status::ready);
    REQUIRE(weak.expired());
}

TEST_CASE("TimerQueue destroyed when a callback's captures are released", "[util][timer]") {
    std::promise<void> ran;
    auto queue = std::make_shared<TimerQueue>();
    std::weak_ptr<TimerQueue> weak = queue;
    auto* raw = queue.get();

    // the callback holds the only reference; it is dropped after the call returns
    raw->schedule(10ms, [keep = std::move(queue), &ran] { ran.set_value(); });

    REQUIRE(ran.get_future().wait_for(2s) == std::future_status::ready);
    for (int i = 0; i < 200 && !weak.expired(); ++i)
        std::this_thread::sleep_for(5ms);
    REQUIRE(weak.expired());
}
