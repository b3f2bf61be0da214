// Standard Library Headers
#include <algorithm>

// Project Headers
#include "input_state.h"
#include "world.h"

//----------------------------------------------------------------------
// World Class implementation

const PixelBuffer::Color World::kBoxColor{0xff, 0xff, 0x50, 0xff};

void World::Update([[maybe_unused]] const InputState &input)
{
    // Do nothing
}

void World::Draw(PixelBuffer &frame) const
{
    const uint32_t xEnd = std::min(kBoxMax, frame.GetWidth());
    const uint32_t yEnd = std::min(kBoxMax, frame.GetHeight());

    for (uint32_t y = kBoxMin + 1; y < yEnd; ++y)
    {
        for (uint32_t x = kBoxMin + 1; x < xEnd; ++x)
        {
            frame.SetPixel(x, y, kBoxColor);
        }
    }
}
