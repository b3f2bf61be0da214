#pragma once

// Project Headers
#include "pixel_buffer.h"

// Forward Declarations
struct InputState;

// World Class
//
// Simulation state advanced once per timer tick and drawn into the pixel
// buffer on every redraw. There is no state yet; the hooks are the extension
// points for it.
class World
{
  public:
    // Constructor
    World() = default;

    // Rule of 5
    World(const World &) = default;
    World &operator=(const World &) = default;
    World(World &&) = default;
    World &operator=(World &&) = default;

    // Public Interface
    void Update(const InputState &input);

    // Draws over the existing frame contents. The frame is not cleared, so
    // anything outside the drawn shapes keeps its previous value.
    void Draw(PixelBuffer &frame) const;

    // Static Constants
    static constexpr uint32_t kBoxMin = 50; // Exclusive
    static constexpr uint32_t kBoxMax = 100; // Exclusive
    static const PixelBuffer::Color kBoxColor;
};
