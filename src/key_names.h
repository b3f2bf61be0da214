#pragma once

// Standard Library Headers
#include <string>

// Name of a non-printable GLFW key ("Escape", "ArrowUp", "F1", ...), or
// nullptr if the key has no name.
const char *NamedKeyName(int key) noexcept;

// Display form of a key for diagnostics. printableName is what
// glfwGetKeyName reported for the key, or nullptr.
//   Character("a") | Named(Escape) | Unidentified(<scancode>)
std::string KeyDisplayName(int key, int scancode, const char *printableName);
