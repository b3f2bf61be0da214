#pragma once

// Standard Library Headers
#include <cstddef>
#include <cstdint>
#include <vector>

// Third-Party Library Headers
#include <glm/glm.hpp>

// PixelBuffer Class
//
// A fixed-size RGBA8 image stored row-major, four bytes per pixel. The byte
// length is always width * height * 4.
class PixelBuffer
{
  public:
    // Types
    using Color = glm::u8vec4;

    static constexpr uint32_t kBytesPerPixel = 4;

    // Constructor
    PixelBuffer(uint32_t width, uint32_t height);

    // Rule of 5
    PixelBuffer(const PixelBuffer &) = default;
    PixelBuffer &operator=(const PixelBuffer &) = default;
    PixelBuffer(PixelBuffer &&) = default;
    PixelBuffer &operator=(PixelBuffer &&) = default;

    // Public Interface
    void SetPixel(uint32_t x, uint32_t y, const Color &color) noexcept;
    Color GetPixel(uint32_t x, uint32_t y) const noexcept;
    void Fill(const Color &color) noexcept;

    // Accessors
    uint32_t GetWidth() const noexcept
    {
        return m_width;
    }
    uint32_t GetHeight() const noexcept
    {
        return m_height;
    }
    uint32_t GetBytesPerRow() const noexcept
    {
        return m_width * kBytesPerPixel;
    }
    size_t GetSizeInBytes() const noexcept
    {
        return m_data.size();
    }
    uint8_t *GetData() noexcept
    {
        return m_data.data();
    }
    const uint8_t *GetData() const noexcept
    {
        return m_data.data();
    }

  private:
    size_t Offset(uint32_t x, uint32_t y) const noexcept
    {
        return (static_cast<size_t>(y) * m_width + x) * kBytesPerPixel;
    }

    uint32_t m_width;
    uint32_t m_height;
    std::vector<uint8_t> m_data;
};
