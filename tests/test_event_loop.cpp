#include <catch2/catch.hpp>
#include "event_loop.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace cordbridge;
using std::chrono::milliseconds;

TEST_CASE("AsioEventLoop: posted tasks and timers run in order", "[loop]") {
    AsioEventLoop loop;
    std::vector<std::string> order;

    loop.schedule(milliseconds(5), [&]() {
        order.push_back("timer");
        loop.stop();
    });
    loop.post([&]() { order.push_back("posted"); });
    loop.run();

    REQUIRE(order == std::vector<std::string>{"posted", "timer"});
}

TEST_CASE("AsioEventLoop: cancel before expiry stops the task", "[loop]") {
    AsioEventLoop loop;
    bool fired = false;

    TimerId id = loop.schedule(milliseconds(10), [&]() { fired = true; });
    loop.schedule(milliseconds(30), [&]() { loop.stop(); });
    REQUIRE(loop.cancel(id));
    REQUIRE_FALSE(loop.cancel(id));
    loop.run();

    REQUIRE_FALSE(fired);
}

TEST_CASE("AsioEventLoop: cancel after firing returns false", "[loop]") {
    AsioEventLoop loop;
    TimerId id = 0;
    bool cancelled = true;

    id = loop.schedule(milliseconds(1), []() {});
    loop.schedule(milliseconds(20), [&]() {
        cancelled = loop.cancel(id);
        loop.stop();
    });
    loop.run();

    REQUIRE_FALSE(cancelled);
}

TEST_CASE("AsioEventLoop: cancelled timer whose wait already completed stays silent", "[loop]") {
    for (int round = 0; round < 20; ++round) {
        AsioEventLoop loop;
        TimerId victim = 0;
        bool cancelled = false;
        bool victim_ran = false;

        loop.schedule(milliseconds(1), [&]() { cancelled = loop.cancel(victim); });
        victim = loop.schedule(milliseconds(2), [&]() { victim_ran = true; });
        loop.schedule(milliseconds(40), [&]() { loop.stop(); });
        // Hold the loop so both timers expire before either handler runs.
        loop.post([]() { std::this_thread::sleep_for(milliseconds(5)); });
        loop.run();

        REQUIRE(cancelled);
        REQUIRE_FALSE(victim_ran);
    }
}
