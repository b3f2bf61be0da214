// Standard Library Headers
#include <string>

// Third-Party Library Headers
#include <GLFW/glfw3.h>

// Project Headers
#include "key_names.h"

//----------------------------------------------------------------------
// Internal Utility Functions

namespace
{

const char *FunctionKeyName(int key) noexcept
{
    static const char *const kNames[] = {"F1",  "F2",  "F3",  "F4",  "F5",  "F6",  "F7",  "F8",  "F9",
                                         "F10", "F11", "F12", "F13", "F14", "F15", "F16", "F17", "F18",
                                         "F19", "F20", "F21", "F22", "F23", "F24", "F25"};
    return kNames[key - GLFW_KEY_F1];
}

} // namespace

//----------------------------------------------------------------------
// Key name lookup

const char *NamedKeyName(int key) noexcept
{
    if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F25)
    {
        return FunctionKeyName(key);
    }

    switch (key)
    {
    case GLFW_KEY_SPACE:
        return "Space";
    case GLFW_KEY_ESCAPE:
        return "Escape";
    case GLFW_KEY_ENTER:
    case GLFW_KEY_KP_ENTER:
        return "Enter";
    case GLFW_KEY_TAB:
        return "Tab";
    case GLFW_KEY_BACKSPACE:
        return "Backspace";
    case GLFW_KEY_INSERT:
        return "Insert";
    case GLFW_KEY_DELETE:
        return "Delete";
    case GLFW_KEY_RIGHT:
        return "ArrowRight";
    case GLFW_KEY_LEFT:
        return "ArrowLeft";
    case GLFW_KEY_DOWN:
        return "ArrowDown";
    case GLFW_KEY_UP:
        return "ArrowUp";
    case GLFW_KEY_PAGE_UP:
        return "PageUp";
    case GLFW_KEY_PAGE_DOWN:
        return "PageDown";
    case GLFW_KEY_HOME:
        return "Home";
    case GLFW_KEY_END:
        return "End";
    case GLFW_KEY_CAPS_LOCK:
        return "CapsLock";
    case GLFW_KEY_SCROLL_LOCK:
        return "ScrollLock";
    case GLFW_KEY_NUM_LOCK:
        return "NumLock";
    case GLFW_KEY_PRINT_SCREEN:
        return "PrintScreen";
    case GLFW_KEY_PAUSE:
        return "Pause";
    case GLFW_KEY_LEFT_SHIFT:
    case GLFW_KEY_RIGHT_SHIFT:
        return "Shift";
    case GLFW_KEY_LEFT_CONTROL:
    case GLFW_KEY_RIGHT_CONTROL:
        return "Control";
    case GLFW_KEY_LEFT_ALT:
    case GLFW_KEY_RIGHT_ALT:
        return "Alt";
    case GLFW_KEY_LEFT_SUPER:
    case GLFW_KEY_RIGHT_SUPER:
        return "Super";
    case GLFW_KEY_MENU:
        return "ContextMenu";
    default:
        return nullptr;
    }
}

std::string KeyDisplayName(int key, int scancode, const char *printableName)
{
    // Space has a printable name on some platforms; report it as named
    if (const char *named = NamedKeyName(key))
    {
        return std::string("Named(") + named + ")";
    }

    if (printableName && *printableName)
    {
        return std::string("Character(\"") + printableName + "\")";
    }

    return "Unidentified(" + std::to_string(scancode) + ")";
}
