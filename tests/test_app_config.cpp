// tests/test_app_config.cpp
//
// Coverage for ValidateConfig in src/app_config.{h,cpp}.

#include <doctest/doctest.h>

#include "app_config.h"

#include <chrono>
#include <string>

using namespace std::chrono_literals;

TEST_CASE("Default AppConfig is valid")
{
    AppConfig config;
    std::string error = "stale";

    CHECK(ValidateConfig(config, error));
    CHECK(error.empty());
    CHECK(config.title == "The Thing");
    CHECK(config.windowWidth == 640);
    CHECK(config.windowHeight == 480);
    CHECK(config.pixelsWidth == 320);
    CHECK(config.pixelsHeight == 240);
    CHECK(config.tickInterval == 15ms);
}

TEST_CASE("ValidateConfig rejects unusable settings")
{
    std::string error;

    SUBCASE("empty pixel buffer")
    {
        AppConfig config;
        config.pixelsHeight = 0;
        CHECK_FALSE(ValidateConfig(config, error));
        CHECK(error.find("non-zero") != std::string::npos);
    }

    SUBCASE("window smaller than the pixel buffer")
    {
        AppConfig config;
        config.windowWidth = 300;
        CHECK_FALSE(ValidateConfig(config, error));
        CHECK(error == "Window size 300x480 is smaller than the pixel buffer 320x240.");
    }

    SUBCASE("zero tick interval")
    {
        AppConfig config;
        config.tickInterval = 0ms;
        CHECK_FALSE(ValidateConfig(config, error));
        CHECK_FALSE(error.empty());
    }

    SUBCASE("clear color out of range")
    {
        AppConfig config;
        config.clearColor.b = 1.5;
        CHECK_FALSE(ValidateConfig(config, error));
        CHECK_FALSE(error.empty());
    }
}
