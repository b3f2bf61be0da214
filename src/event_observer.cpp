// Standard Library Headers
#include <iostream>

// Project Headers
#include "event_observer.h"

//----------------------------------------------------------------------
// ConsoleEventObserver Class implementation

ConsoleEventObserver::ConsoleEventObserver(std::ostream &out) : m_out(out)
{
}

void ConsoleEventObserver::OnMouseClicked(const glm::dvec2 &physicalPosition, bool insidePixels,
                                          const glm::ivec2 &pixel)
{
    m_out << "Mouse clicked:" << std::endl;
    m_out << "\tPhysical: " << physicalPosition.x << ", " << physicalPosition.y << std::endl;
    if (insidePixels)
    {
        m_out << "\tPixels: " << pixel.x << ", " << pixel.y << std::endl;
    }
    else
    {
        m_out << "\tNot within Pixels space!" << std::endl;
    }
}

void ConsoleEventObserver::OnKey(const KeyEvent &event)
{
    m_out << (event.pressed ? "Pressed " : "Released ") << event.name << " ("
          << (event.repeat ? "" : "not ") << "repeat)" << std::endl;
}

void ConsoleEventObserver::OnResized(uint32_t width, uint32_t height)
{
    m_out << "Resized to " << width << ", " << height << std::endl;
}
