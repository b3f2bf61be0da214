// Standard Library Headers
#include <algorithm>
#include <cmath>

// Project Headers
#include "scaling_transform.h"

//----------------------------------------------------------------------
// ScalingTransform Class implementation

ScalingTransform::ScalingTransform(glm::uvec2 textureSize, glm::uvec2 surfaceSize)
    : m_textureSize(textureSize), m_surfaceSize(surfaceSize)
{
    const float textureWidth = static_cast<float>(std::max(textureSize.x, 1u));
    const float textureHeight = static_cast<float>(std::max(textureSize.y, 1u));
    const float screenWidth = static_cast<float>(std::max(surfaceSize.x, 1u));
    const float screenHeight = static_cast<float>(std::max(surfaceSize.y, 1u));

    // Largest whole scale factor that fits on both axes
    const float widthRatio = std::max(screenWidth / textureWidth, 1.0f);
    const float heightRatio = std::max(screenHeight / textureHeight, 1.0f);
    m_scale = std::max(std::floor(std::min(widthRatio, heightRatio)), 1.0f);

    const float scaledWidth = textureWidth * m_scale;
    const float scaledHeight = textureHeight * m_scale;

    // Scale in NDC, with a half-pixel offset on odd-sized surfaces so texels
    // land on pixel boundaries
    const float sw = scaledWidth / screenWidth;
    const float sh = scaledHeight / screenHeight;
    const float tx = std::fmod(screenWidth / 2.0f, 1.0f) / screenWidth;
    const float ty = std::fmod(screenHeight / 2.0f, 1.0f) / screenHeight;

    // glm matrices are column-major
    m_matrix = glm::mat4(1.0f);
    m_matrix[0][0] = sw;
    m_matrix[1][1] = sh;
    m_matrix[3][0] = tx;
    m_matrix[3][1] = ty;
    m_inverseMatrix = glm::inverse(m_matrix);

    // Clip rectangle for the scaled image, clamped to the surface
    const float clipWidth = std::min(scaledWidth, screenWidth);
    const float clipHeight = std::min(scaledHeight, screenHeight);
    m_clipRect.x = static_cast<uint32_t>((screenWidth - clipWidth) / 2.0f);
    m_clipRect.y = static_cast<uint32_t>((screenHeight - clipHeight) / 2.0f);
    m_clipRect.width = static_cast<uint32_t>(clipWidth);
    m_clipRect.height = static_cast<uint32_t>(clipHeight);
}

bool ScalingTransform::WindowPosToPixel(const glm::vec2 &physicalPosition, glm::ivec2 &pixel) const noexcept
{
    const float physicalWidth = static_cast<float>(std::max(m_surfaceSize.x, 1u));
    const float physicalHeight = static_cast<float>(std::max(m_surfaceSize.y, 1u));
    const float pixelsWidth = static_cast<float>(m_textureSize.x);
    const float pixelsHeight = static_cast<float>(m_textureSize.y);

    // Window position to normalized device coordinates, then undo the scaling
    glm::vec4 position(physicalPosition.x / physicalWidth * 2.0f - 1.0f,
                       physicalPosition.y / physicalHeight * 2.0f - 1.0f, 0.0f, 1.0f);
    position = m_inverseMatrix * position;
    const glm::vec2 ndc(position.x / position.w, position.y / position.w);

    pixel.x = static_cast<int>(std::floor((ndc.x + 1.0f) / 2.0f * pixelsWidth));
    pixel.y = static_cast<int>(std::floor((ndc.y + 1.0f) / 2.0f * pixelsHeight));

    return pixel.x >= 0 && pixel.x < static_cast<int>(m_textureSize.x) && pixel.y >= 0 &&
           pixel.y < static_cast<int>(m_textureSize.y);
}
