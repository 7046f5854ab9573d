// ControlQueue + TickTimer: the single control context.

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "ControlQueue.hpp"
#include "TickTimer.hpp"

using namespace std::chrono_literals;

TEST_CASE("Posted tasks run in order on the draining thread", "[control]") {
    ControlQueue queue;
    std::vector<int> order;
    const auto owner = std::this_thread::get_id();
    bool sameThread = true;

    std::thread worker([&]() {
        for (int i = 0; i < 5; ++i) {
            queue.post([&, i]() {
                order.push_back(i);
                sameThread = sameThread && std::this_thread::get_id() == owner;
            });
        }
    });
    worker.join();

    REQUIRE(queue.pending() == 5);
    REQUIRE(queue.processPending() == 5);
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
    REQUIRE(sameThread);
    REQUIRE(queue.pending() == 0);
}

TEST_CASE("Tasks posted while draining wait for the next drain", "[control]") {
    ControlQueue queue;
    int runs = 0;
    queue.post([&]() {
        ++runs;
        queue.post([&]() { ++runs; });
    });

    REQUIRE(queue.processPending() == 1);
    REQUIRE(runs == 1);
    REQUIRE(queue.processPending() == 1);
    REQUIRE(runs == 2);
}

TEST_CASE("runUntil gives up at its timeout", "[control]") {
    ControlQueue queue;
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(queue.runUntil([] { return false; }, 50ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);

    bool flag = false;
    std::thread worker([&]() {
        std::this_thread::sleep_for(10ms);
        queue.post([&]() { flag = true; });
    });
    REQUIRE(queue.runUntil([&] { return flag; }, 2000ms));
    worker.join();
}

TEST_CASE("TickTimer ticks on the control context", "[control][tick]") {
    ControlQueue queue;
    TickTimer timer(queue);
    int ticks = 0;

    timer.start(200.0, [&]() { ++ticks; });
    REQUIRE(timer.isRunning());
    REQUIRE(queue.runUntil([&] { return ticks >= 3; }, 2000ms));

    timer.stop();
    REQUIRE_FALSE(timer.isRunning());
}

TEST_CASE("No tick runs after stop, even if already queued", "[control][tick]") {
    ControlQueue queue;
    TickTimer timer(queue);
    std::atomic<int> ticks{0};

    timer.start(500.0, [&]() { ++ticks; });
    // Let ticks pile up undrained.
    std::this_thread::sleep_for(30ms);
    timer.stop();
    REQUIRE(queue.pending() > 0);

    queue.processPending();
    REQUIRE(ticks.load() == 0);
}

TEST_CASE("Restarting the timer drops ticks from the previous run", "[control][tick]") {
    ControlQueue queue;
    TickTimer timer(queue);
    int oldTicks = 0;
    int newTicks = 0;

    timer.start(500.0, [&]() { ++oldTicks; });
    std::this_thread::sleep_for(20ms);
    timer.start(500.0, [&]() { ++newTicks; });

    REQUIRE(queue.runUntil([&] { return newTicks >= 2; }, 2000ms));
    REQUIRE(oldTicks == 0);
    timer.stop();
}

TEST_CASE("Invalid tick rates do not start the timer", "[control][tick]") {
    ControlQueue queue;
    TickTimer timer(queue);
    timer.start(0.0, [] {});
    REQUIRE_FALSE(timer.isRunning());
    timer.start(60.0, TickTimer::Handler{});
    REQUIRE_FALSE(timer.isRunning());
}
