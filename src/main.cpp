// Standard Library Headers
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

// Project Headers
#include "app_config.h"
#include "application.h"
#include "event_observer.h"

// Logical window size. The window is larger in physical pixels on HiDPI
// displays.
constexpr uint32_t kWindowWidth = 640;
constexpr uint32_t kWindowHeight = 480;

// Logical pixel buffer size. It is scaled up by a whole number to fit the
// window, which is in turn scaled by the display.
constexpr uint32_t kPixelsWidth = 320;
constexpr uint32_t kPixelsHeight = 240;

// Update and redraw interval
constexpr std::chrono::milliseconds kTickInterval{15};

// Main function
int main()
{
    AppConfig config;
    config.title = "The Thing";
    config.windowWidth = kWindowWidth;
    config.windowHeight = kWindowHeight;
    config.pixelsWidth = kPixelsWidth;
    config.pixelsHeight = kPixelsHeight;
    config.tickInterval = kTickInterval;
    config.clearColor = glm::dvec4(0.1, 0.1, 0.15, 1.0);

    std::string error;
    if (!ValidateConfig(config, error))
    {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return EXIT_FAILURE;
    }

    // Create and run the application
    ConsoleEventObserver observer(std::cout);
    Application app(config, observer);

    return app.Run() ? EXIT_SUCCESS : EXIT_FAILURE;
}
