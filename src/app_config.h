#pragma once

// Standard Library Headers
#include <chrono>
#include <cstdint>
#include <string>

// Third-Party Library Headers
#include <glm/glm.hpp>

// Application configuration. All sizes are logical (pre content-scale).
struct AppConfig
{
    std::string title = "The Thing";

    // Window size
    uint32_t windowWidth = 640;
    uint32_t windowHeight = 480;

    // Pixel buffer size, also the minimum window size
    uint32_t pixelsWidth = 320;
    uint32_t pixelsHeight = 240;

    // Time between update ticks
    std::chrono::milliseconds tickInterval{15};

    // Color outside the scaled pixel image (RGBA, 0-1)
    glm::dvec4 clearColor{0.1, 0.1, 0.15, 1.0};
};

// Returns false and fills in the reason if the configuration cannot be used.
bool ValidateConfig(const AppConfig &config, std::string &error);
