#pragma once

// Standard Library Headers
#include <chrono>

// FixedTimer Class
//
// A one-shot deadline that the owner rearms after every tick. Rearming is
// relative to the time of the rearm, so late ticks push later deadlines back
// rather than catching up.
class FixedTimer
{
  public:
    // Types
    using Clock = std::chrono::steady_clock;

    // Constructor
    explicit FixedTimer(Clock::duration interval) : m_interval(interval)
    {
    }

    // Public Interface
    void Arm(Clock::time_point now) noexcept;
    bool IsDue(Clock::time_point now) const noexcept;
    double SecondsUntilDeadline(Clock::time_point now) const noexcept;

    // Accessors
    bool IsArmed() const noexcept
    {
        return m_armed;
    }
    Clock::time_point GetDeadline() const noexcept
    {
        return m_deadline;
    }
    Clock::duration GetInterval() const noexcept
    {
        return m_interval;
    }

  private:
    Clock::duration m_interval;
    Clock::time_point m_deadline{};
    bool m_armed = false;
};
