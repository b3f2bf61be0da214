// tests/test_input_state.cpp
//
// Coverage for src/input_state.{h,cpp}: events collect in a pending state and
// only become visible to the update hook on Commit().

#include <doctest/doctest.h>

#include "input_state.h"

TEST_CASE("InputState starts with the cursor at (-1, -1) and nothing held")
{
    InputTracker tracker;
    CHECK(tracker.GetState().cursorPosition == glm::dvec2(-1.0, -1.0));
    CHECK_FALSE(tracker.GetState().leftButtonDown);
    CHECK(tracker.GetState().leftClicks == 0);
    CHECK_FALSE(tracker.GetState().IsKeyDown(GLFW_KEY_A));
}

TEST_CASE("InputTracker keeps events pending until Commit")
{
    InputTracker tracker;
    tracker.OnCursorMoved({10.0, 20.0});
    tracker.OnCursorMoved({30.5, 40.25});
    tracker.OnKey(GLFW_KEY_SPACE, true);

    // Pending sees every event as it arrives
    CHECK(tracker.GetPendingState().cursorPosition == glm::dvec2(30.5, 40.25));
    CHECK(tracker.GetPendingState().IsKeyDown(GLFW_KEY_SPACE));

    // The snapshot does not change mid-batch
    CHECK(tracker.GetState().cursorPosition == glm::dvec2(-1.0, -1.0));
    CHECK_FALSE(tracker.GetState().IsKeyDown(GLFW_KEY_SPACE));

    tracker.Commit();
    CHECK(tracker.GetState().cursorPosition == glm::dvec2(30.5, 40.25));
    CHECK(tracker.GetState().IsKeyDown(GLFW_KEY_SPACE));

    tracker.OnKey(GLFW_KEY_SPACE, false);
    tracker.Commit();
    CHECK_FALSE(tracker.GetState().IsKeyDown(GLFW_KEY_SPACE));
}

TEST_CASE("InputTracker counts left clicks per batch")
{
    InputTracker tracker;
    tracker.OnMouseButton(GLFW_MOUSE_BUTTON_LEFT, true);
    tracker.OnMouseButton(GLFW_MOUSE_BUTTON_LEFT, false);
    tracker.OnMouseButton(GLFW_MOUSE_BUTTON_LEFT, true);
    tracker.OnMouseButton(GLFW_MOUSE_BUTTON_RIGHT, true);
    tracker.Commit();

    CHECK(tracker.GetState().leftClicks == 2);
    CHECK(tracker.GetState().leftButtonDown);

    // Held buttons carry over, click counts do not
    tracker.Commit();
    CHECK(tracker.GetState().leftClicks == 0);
    CHECK(tracker.GetState().leftButtonDown);
}

TEST_CASE("InputState ignores out-of-range key codes")
{
    InputTracker tracker;
    tracker.OnKey(GLFW_KEY_UNKNOWN, true);
    tracker.OnKey(GLFW_KEY_LAST + 1, true);
    tracker.Commit();

    CHECK_FALSE(tracker.GetState().IsKeyDown(GLFW_KEY_UNKNOWN));
    CHECK_FALSE(tracker.GetState().IsKeyDown(GLFW_KEY_LAST + 1));
}
