// Project Headers
#include "pixel_buffer.h"

//----------------------------------------------------------------------
// PixelBuffer Class implementation

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height)
    : m_width(width), m_height(height), m_data(static_cast<size_t>(width) * height * kBytesPerPixel, 0)
{
}

void PixelBuffer::SetPixel(uint32_t x, uint32_t y, const Color &color) noexcept
{
    if (x >= m_width || y >= m_height)
    {
        return;
    }

    uint8_t *pixel = m_data.data() + Offset(x, y);
    pixel[0] = color.r;
    pixel[1] = color.g;
    pixel[2] = color.b;
    pixel[3] = color.a;
}

PixelBuffer::Color PixelBuffer::GetPixel(uint32_t x, uint32_t y) const noexcept
{
    if (x >= m_width || y >= m_height)
    {
        return Color(0);
    }

    const uint8_t *pixel = m_data.data() + Offset(x, y);
    return Color(pixel[0], pixel[1], pixel[2], pixel[3]);
}

void PixelBuffer::Fill(const Color &color) noexcept
{
    for (size_t i = 0; i < m_data.size(); i += kBytesPerPixel)
    {
        m_data[i + 0] = color.r;
        m_data[i + 1] = color.g;
        m_data[i + 2] = color.b;
        m_data[i + 3] = color.a;
    }
}
