#pragma once

// Standard Library Headers
#include <array>

// Third-Party Library Headers
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

// Snapshot of pointer and keyboard state
struct InputState
{
    glm::dvec2 cursorPosition{-1.0, -1.0}; // Physical pixels, (-1, -1) until the first move
    bool leftButtonDown = false;
    int leftClicks = 0; // Presses since the previous snapshot
    std::array<bool, GLFW_KEY_LAST + 1> keysDown{};

    bool IsKeyDown(int key) const noexcept
    {
        return key >= 0 && key <= GLFW_KEY_LAST && keysDown[key];
    }
};

// InputTracker Class
//
// Events are recorded into a pending state as they arrive. Commit() publishes
// the pending state as the current snapshot, once per event batch.
class InputTracker
{
  public:
    // Constructor
    InputTracker() = default;

    // Public Interface
    void OnCursorMoved(const glm::dvec2 &physicalPosition) noexcept;
    void OnMouseButton(int button, bool pressed) noexcept;
    void OnKey(int key, bool pressed) noexcept;
    void Commit() noexcept;

    // Accessors
    const InputState &GetState() const noexcept
    {
        return m_current;
    }
    const InputState &GetPendingState() const noexcept
    {
        return m_pending;
    }

  private:
    InputState m_pending;
    InputState m_current;
};
