#include <catch2/catch.hpp>
#include "timer_queue.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace fanrelay;
using namespace std::chrono_literals;

TEST_CASE("TimerQueue: runs action after delay", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> ran{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed_ms{0};

    auto handle = timers.schedule(30ms, [&]() {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ran = true;
    });
    REQUIRE(handle.armed());

    REQUIRE(wait_until([&]() { return ran.load(); }));
    REQUIRE(elapsed_ms.load() >= 30);
    REQUIRE_FALSE(handle.armed());
    REQUIRE_FALSE(handle.cancel());  // already fired
}

TEST_CASE("TimerQueue: fires in deadline order", "[timer]") {
    TimerQueue timers;
    std::mutex mu;
    std::vector<int> order;
    auto record = [&](int n) {
        std::lock_guard<std::mutex> lock(mu);
        order.push_back(n);
    };

    timers.schedule(60ms, [&]() { record(3); });
    timers.schedule(20ms, [&]() { record(1); });
    timers.schedule(40ms, [&]() { record(2); });

    REQUIRE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mu);
        return order.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(mu);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("TimerQueue: cancel prevents the action", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> ran{false};

    auto handle = timers.schedule(40ms, [&]() { ran = true; });
    REQUIRE(handle.cancel());
    REQUIRE_FALSE(handle.cancel());  // idempotent
    REQUIRE_FALSE(handle.armed());

    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(ran.load());
}

TEST_CASE("TimerQueue: default handle is inert", "[timer]") {
    TimerHandle handle;
    REQUIRE_FALSE(handle.armed());
    REQUIRE_FALSE(handle.cancel());
}

TEST_CASE("TimerQueue: throwing action does not kill the thread", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> second{false};

    timers.schedule(5ms, []() { throw std::runtime_error("boom"); });
    timers.schedule(20ms, [&]() { second = true; });

    REQUIRE(wait_until([&]() { return second.load(); }));
}

TEST_CASE("TimerQueue: stop drops pending actions", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> ran{false};

    auto handle = timers.schedule(10s, [&]() { ran = true; });
    REQUIRE(timers.pending() == 1);

    timers.stop();
    timers.stop();  // idempotent
    REQUIRE(timers.pending() == 0);
    REQUIRE_FALSE(handle.armed());
    REQUIRE_FALSE(ran.load());

    auto late = timers.schedule(1ms, [&]() { ran = true; });
    REQUIRE_FALSE(late.armed());
}
