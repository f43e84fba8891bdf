#include <catch2/catch_test_macros.hpp>
#include <core/util/event_queue.h>
#include <thread>

using deckhand::EventQueue;
using namespace std::chrono_literals;

TEST_CASE("EventQueue drops instead of blocking when full", "[event_queue]") {
    EventQueue<int> queue(2);

    REQUIRE(queue.TryPush(1));
    REQUIRE(queue.TryPush(2));
    REQUIRE_FALSE(queue.TryPush(3));
    REQUIRE(queue.dropped() == 1);
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.Poll() == 1);
    REQUIRE(queue.Poll() == 2);
    REQUIRE_FALSE(queue.Poll());
}

TEST_CASE("EventQueue wakes a waiting consumer", "[event_queue]") {
    EventQueue<int> queue(4);

    SECTION("on push") {
        std::jthread producer([&queue] {
            std::this_thread::sleep_for(20ms);
            queue.TryPush(42);
        });
        REQUIRE(queue.WaitPop(5s) == 42);
    }

    SECTION("on close") {
        std::jthread closer([&queue] {
            std::this_thread::sleep_for(20ms);
            queue.Close();
        });
        REQUIRE_FALSE(queue.WaitPop(5s));
        REQUIRE_FALSE(queue.TryPush(1));
    }

    SECTION("on timeout") {
        REQUIRE_FALSE(queue.WaitPop(10ms));
    }
}
