// tests/test_fixed_timer.cpp
//
// Coverage for src/fixed_timer.{h,cpp}. Time points are synthetic so the
// tests never sleep.

#include <doctest/doctest.h>

#include "fixed_timer.h"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("FixedTimer is not due until armed")
{
    FixedTimer timer(15ms);
    const FixedTimer::Clock::time_point start{};

    CHECK_FALSE(timer.IsArmed());
    CHECK_FALSE(timer.IsDue(start + 1s));
    CHECK(timer.SecondsUntilDeadline(start) == doctest::Approx(0.0));
}

TEST_CASE("FixedTimer fires once the interval has elapsed")
{
    FixedTimer timer(15ms);
    const FixedTimer::Clock::time_point start{};
    timer.Arm(start);

    CHECK(timer.IsArmed());
    CHECK(timer.GetDeadline() == start + 15ms);
    CHECK_FALSE(timer.IsDue(start));
    CHECK_FALSE(timer.IsDue(start + 14ms));
    CHECK(timer.IsDue(start + 15ms));
    CHECK(timer.IsDue(start + 40ms));

    CHECK(timer.SecondsUntilDeadline(start + 5ms) == doctest::Approx(0.010));
    CHECK(timer.SecondsUntilDeadline(start + 20ms) == doctest::Approx(0.0));
}

TEST_CASE("FixedTimer rearms from the rearm time, so lateness accumulates")
{
    FixedTimer timer(15ms);
    const FixedTimer::Clock::time_point start{};
    timer.Arm(start);

    // The tick is handled 3ms late and the handler takes another 2ms
    const auto tickHandled = start + 18ms;
    REQUIRE(timer.IsDue(tickHandled));
    timer.Arm(tickHandled + 2ms);

    CHECK(timer.GetDeadline() == start + 35ms);
    CHECK_FALSE(timer.IsDue(start + 30ms));
    CHECK(timer.IsDue(start + 35ms));
}
