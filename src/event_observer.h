#pragma once

// Standard Library Headers
#include <cstdint>
#include <iosfwd>
#include <string>

// Third-Party Library Headers
#include <glm/glm.hpp>

// A key press, repeat or release as reported to observers
struct KeyEvent
{
    int key = 0;
    int scancode = 0;
    std::string name; // See KeyDisplayName()
    bool pressed = false;
    bool repeat = false;
};

// EventObserver Interface
//
// Receives diagnostic notifications from the event loop.
class EventObserver
{
  public:
    virtual ~EventObserver() = default;

    // insidePixels is false when the click did not land on the pixel image;
    // pixel then holds the out-of-range coordinates.
    virtual void OnMouseClicked(const glm::dvec2 &physicalPosition, bool insidePixels, const glm::ivec2 &pixel) = 0;
    virtual void OnKey(const KeyEvent &event) = 0;
    virtual void OnResized(uint32_t width, uint32_t height) = 0;
};

// ConsoleEventObserver Class
//
// Prints each notification as plain text to a stream.
class ConsoleEventObserver : public EventObserver
{
  public:
    // Constructor
    explicit ConsoleEventObserver(std::ostream &out);

    // EventObserver Interface
    void OnMouseClicked(const glm::dvec2 &physicalPosition, bool insidePixels, const glm::ivec2 &pixel) override;
    void OnKey(const KeyEvent &event) override;
    void OnResized(uint32_t width, uint32_t height) override;

  private:
    std::ostream &m_out; // Non-owning
};
