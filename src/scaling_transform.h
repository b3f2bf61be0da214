#pragma once

// Standard Library Headers
#include <cstdint>

// Third-Party Library Headers
#include <glm/glm.hpp>

// ScalingTransform Class
//
// Fits a fixed-size pixel image into a physical surface using the largest
// integer scale that fits (never less than 1) and centers it.
class ScalingTransform
{
  public:
    // Types
    struct ClipRect
    {
        uint32_t x = 0;
        uint32_t y = 0;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    // Constructors
    ScalingTransform() = default;
    ScalingTransform(glm::uvec2 textureSize, glm::uvec2 surfaceSize);

    // Public Interface

    // Maps a physical window position to pixel coordinates. Returns false if
    // the position lies outside the scaled image; the unclamped coordinates
    // are written to pixel either way.
    bool WindowPosToPixel(const glm::vec2 &physicalPosition, glm::ivec2 &pixel) const noexcept;

    // Accessors
    const glm::mat4 &GetMatrix() const noexcept
    {
        return m_matrix;
    }
    const ClipRect &GetClipRect() const noexcept
    {
        return m_clipRect;
    }
    float GetScale() const noexcept
    {
        return m_scale;
    }
    glm::uvec2 GetTextureSize() const noexcept
    {
        return m_textureSize;
    }
    glm::uvec2 GetSurfaceSize() const noexcept
    {
        return m_surfaceSize;
    }

  private:
    glm::uvec2 m_textureSize{1, 1};
    glm::uvec2 m_surfaceSize{1, 1};
    float m_scale = 1.0f;
    glm::mat4 m_matrix{1.0f};
    glm::mat4 m_inverseMatrix{1.0f};
    ClipRect m_clipRect;
};
