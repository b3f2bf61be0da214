// Project Headers
#include "app_config.h"

bool ValidateConfig(const AppConfig &config, std::string &error)
{
    if (config.pixelsWidth == 0 || config.pixelsHeight == 0)
    {
        error = "Pixel buffer size must be non-zero.";
        return false;
    }

    if (config.windowWidth < config.pixelsWidth || config.windowHeight < config.pixelsHeight)
    {
        error = "Window size " + std::to_string(config.windowWidth) + "x" + std::to_string(config.windowHeight) +
                " is smaller than the pixel buffer " + std::to_string(config.pixelsWidth) + "x" +
                std::to_string(config.pixelsHeight) + ".";
        return false;
    }

    if (config.tickInterval.count() <= 0)
    {
        error = "Tick interval must be positive.";
        return false;
    }

    for (int i = 0; i < 4; ++i)
    {
        if (config.clearColor[i] < 0.0 || config.clearColor[i] > 1.0)
        {
            error = "Clear color components must be in [0, 1].";
            return false;
        }
    }

    error.clear();
    return true;
}
