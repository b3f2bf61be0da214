// Project Headers
#include "input_state.h"

//----------------------------------------------------------------------
// InputTracker Class implementation

void InputTracker::OnCursorMoved(const glm::dvec2 &physicalPosition) noexcept
{
    m_pending.cursorPosition = physicalPosition;
}

void InputTracker::OnMouseButton(int button, bool pressed) noexcept
{
    if (button != GLFW_MOUSE_BUTTON_LEFT)
    {
        return;
    }

    if (pressed && !m_pending.leftButtonDown)
    {
        ++m_pending.leftClicks;
    }
    m_pending.leftButtonDown = pressed;
}

void InputTracker::OnKey(int key, bool pressed) noexcept
{
    if (key >= 0 && key <= GLFW_KEY_LAST)
    {
        m_pending.keysDown[key] = pressed;
    }
}

void InputTracker::Commit() noexcept
{
    m_current = m_pending;

    // Edge counts belong to a single batch
    m_pending.leftClicks = 0;
}
