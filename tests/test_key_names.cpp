#include <doctest/doctest.h>

#include "key_names.h"

#include <GLFW/glfw3.h>

TEST_CASE("KeyDisplayName uses the printable name for character keys")
{
    CHECK(KeyDisplayName(GLFW_KEY_A, 38, "a") == "Character(\"a\")");
    CHECK(KeyDisplayName(GLFW_KEY_SLASH, 61, "/") == "Character(\"/\")");
}

TEST_CASE("KeyDisplayName names non-printable keys")
{
    CHECK(KeyDisplayName(GLFW_KEY_ESCAPE, 9, nullptr) == "Named(Escape)");
    CHECK(KeyDisplayName(GLFW_KEY_UP, 111, nullptr) == "Named(ArrowUp)");
    CHECK(KeyDisplayName(GLFW_KEY_F1, 67, nullptr) == "Named(F1)");
    CHECK(KeyDisplayName(GLFW_KEY_F25, 0, nullptr) == "Named(F25)");
    CHECK(KeyDisplayName(GLFW_KEY_LEFT_SHIFT, 50, nullptr) == "Named(Shift)");

    // Named wins over a printable name
    CHECK(KeyDisplayName(GLFW_KEY_SPACE, 65, " ") == "Named(Space)");
}

TEST_CASE("KeyDisplayName falls back to the scancode")
{
    CHECK(KeyDisplayName(GLFW_KEY_UNKNOWN, 248, nullptr) == "Unidentified(248)");
    CHECK(KeyDisplayName(GLFW_KEY_WORLD_1, 94, "") == "Unidentified(94)");
    CHECK(NamedKeyName(GLFW_KEY_A) == nullptr);
}
