#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/transfer/speed_calculator.h>

using namespace deckhand::core;
using namespace std::chrono_literals;

TEST_CASE("SpeedCalculator reports zero without enough samples", "[transfer][speed]") {
    SpeedCalculator speed;
    REQUIRE(speed.BytesPerSecond() == 0.0);

    speed.AddBytes(1000);
    REQUIRE(speed.BytesPerSecond() == 0.0);
    REQUIRE(speed.EtaSeconds(1000) == 0.0);
}

TEST_CASE("SpeedCalculator averages over its window", "[transfer][speed]") {
    SpeedCalculator speed(5s);
    auto start = SpeedCalculator::Clock::now();

    speed.AddBytes(0, start);
    speed.AddBytes(1000, start + 1s);
    speed.AddBytes(1000, start + 2s);

    REQUIRE(speed.BytesPerSecond() == Catch::Approx(1000.0));
    REQUIRE(speed.EtaSeconds(5000) == Catch::Approx(5.0));
}

TEST_CASE("SpeedCalculator drops samples outside the window", "[transfer][speed]") {
    SpeedCalculator speed(2s);
    auto start = SpeedCalculator::Clock::now();

    speed.AddBytes(100000, start);
    speed.AddBytes(10, start + 10s);
    speed.AddBytes(10, start + 11s);

    REQUIRE(speed.BytesPerSecond() < 100.0);
}

TEST_CASE("SpeedCalculator bounds its sample count", "[transfer][speed]") {
    SpeedCalculator speed(1h, 10);
    auto start = SpeedCalculator::Clock::now();
    for (int i = 0; i < 100; ++i) {
        speed.AddBytes(1, start + std::chrono::milliseconds(i));
    }

    REQUIRE(speed.sample_count() == 10);

    speed.Reset();
    REQUIRE(speed.sample_count() == 0);
}
