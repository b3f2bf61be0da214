// tests/test_world.cpp
//
// Coverage for src/world.{h,cpp}: the draw hook paints the box over whatever
// is already in the frame, and the update hook changes nothing.

#include <doctest/doctest.h>

#include "input_state.h"
#include "pixel_buffer.h"
#include "world.h"

#include <cstring>
#include <vector>

namespace {

constexpr uint32_t kWidth = 320;
constexpr uint32_t kHeight = 240;

bool InsideBox(uint32_t x, uint32_t y)
{
    return x > 50 && x < 100 && y > 50 && y < 100;
}

// A frame where every pixel has a distinct, non-box value
PixelBuffer MakePatternedFrame()
{
    PixelBuffer frame(kWidth, kHeight);
    for (uint32_t y = 0; y < kHeight; ++y)
    {
        for (uint32_t x = 0; x < kWidth; ++x)
        {
            frame.SetPixel(x, y, PixelBuffer::Color(x & 0xff, y & 0xff, (x + y) & 0x7f, 0x10));
        }
    }
    return frame;
}

} // namespace

TEST_CASE("World::Draw paints every pixel strictly inside (50, 100) x (50, 100)")
{
    PixelBuffer frame(kWidth, kHeight);
    World world;
    world.Draw(frame);

    for (uint32_t y = 51; y < 100; ++y)
    {
        for (uint32_t x = 51; x < 100; ++x)
        {
            const PixelBuffer::Color pixel = frame.GetPixel(x, y);
            CHECK(pixel.r == 0xff);
            CHECK(pixel.g == 0xff);
            CHECK(pixel.b == 0x50);
            CHECK(pixel.a == 0xff);
        }
    }
}

TEST_CASE("World::Draw leaves everything outside the box untouched")
{
    PixelBuffer frame = MakePatternedFrame();
    const PixelBuffer before = frame;

    World world;
    world.Draw(frame);

    int changedOutside = 0;
    int changedInside = 0;
    for (uint32_t y = 0; y < kHeight; ++y)
    {
        for (uint32_t x = 0; x < kWidth; ++x)
        {
            const bool changed = frame.GetPixel(x, y) != before.GetPixel(x, y);
            if (InsideBox(x, y))
                changedInside += changed ? 1 : 0;
            else
                changedOutside += changed ? 1 : 0;
        }
    }

    CHECK(changedOutside == 0);
    CHECK(changedInside == 49 * 49);
}

TEST_CASE("World::Draw does not clear the previous frame")
{
    PixelBuffer frame(kWidth, kHeight);
    frame.SetPixel(0, 0, PixelBuffer::Color(1, 2, 3, 4));
    frame.SetPixel(50, 50, PixelBuffer::Color(9, 9, 9, 9));
    frame.SetPixel(100, 75, PixelBuffer::Color(7, 7, 7, 7));

    World world;
    world.Draw(frame);
    world.Draw(frame);

    CHECK(frame.GetPixel(0, 0) == PixelBuffer::Color(1, 2, 3, 4));
    CHECK(frame.GetPixel(50, 50) == PixelBuffer::Color(9, 9, 9, 9));
    CHECK(frame.GetPixel(100, 75) == PixelBuffer::Color(7, 7, 7, 7));
}

TEST_CASE("World::Draw clips the box to small frames")
{
    PixelBuffer frame(60, 60);
    World world;
    world.Draw(frame);

    CHECK(frame.GetPixel(51, 51) == World::kBoxColor);
    CHECK(frame.GetPixel(59, 59) == World::kBoxColor);
    CHECK(frame.GetPixel(50, 59) == PixelBuffer::Color(0));
    CHECK(frame.GetSizeInBytes() == 60u * 60u * 4u);
}

TEST_CASE("World::Update has no observable effect")
{
    PixelBuffer frame = MakePatternedFrame();
    const std::vector<uint8_t> before(frame.GetData(), frame.GetData() + frame.GetSizeInBytes());

    World world;
    InputState input;
    input.cursorPosition = {75.0, 75.0};
    input.leftButtonDown = true;
    input.leftClicks = 3;

    world.Update(input);
    world.Update(input);

    // Drawing after any number of updates gives the same frame as drawing
    // from a fresh world
    PixelBuffer updated = frame;
    PixelBuffer fresh = frame;
    world.Draw(updated);
    World().Draw(fresh);

    CHECK(std::memcmp(updated.GetData(), fresh.GetData(), updated.GetSizeInBytes()) == 0);
    CHECK(std::memcmp(frame.GetData(), before.data(), before.size()) == 0);
    CHECK(input.leftClicks == 3);
}
