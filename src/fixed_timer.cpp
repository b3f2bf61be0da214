// Project Headers
#include "fixed_timer.h"

//----------------------------------------------------------------------
// FixedTimer Class implementation

void FixedTimer::Arm(Clock::time_point now) noexcept
{
    m_deadline = now + m_interval;
    m_armed = true;
}

bool FixedTimer::IsDue(Clock::time_point now) const noexcept
{
    return m_armed && now >= m_deadline;
}

double FixedTimer::SecondsUntilDeadline(Clock::time_point now) const noexcept
{
    if (!m_armed || now >= m_deadline)
    {
        return 0.0;
    }

    return std::chrono::duration<double>(m_deadline - now).count();
}
