#pragma once

// Standard Library Headers
#include <cstdint>
#include <functional>
#include <string>

// Third-Party Library Headers
#include <glm/glm.hpp>
#include <webgpu/webgpu_cpp.h>

// Project Headers
#include "pixel_buffer.h"
#include "scaling_transform.h"

// Forward Declarations
struct GLFWwindow;

// Pixels Class
//
// A CPU-side RGBA pixel buffer presented in a window through WebGPU. The
// buffer has a fixed logical size and is scaled by a whole number into the
// window's physical surface, centered, with the clear color around it.
class Pixels
{
  public:
    // Constructor
    Pixels(uint32_t width, uint32_t height, const glm::dvec4 &clearColor);

    // Rule of 5
    Pixels(const Pixels &) = delete;
    Pixels &operator=(const Pixels &) = delete;
    Pixels(Pixels &&) = delete;
    Pixels &operator=(Pixels &&) = delete;

    // Public Interface

    // Acquires the GPU device and builds the surface for the window, then
    // invokes callback. Failure to get an adapter or device is fatal.
    void Initialize(GLFWwindow *window, uint32_t surfaceWidth, uint32_t surfaceHeight,
                    const std::function<void()> &callback);
    void ResizeSurface(uint32_t width, uint32_t height);
    bool Render();
    bool WindowPosToPixel(const glm::vec2 &physicalPosition, glm::ivec2 &pixel) const noexcept;

    // Accessors
    PixelBuffer &Frame() noexcept
    {
        return m_frame;
    }
    const PixelBuffer &Frame() const noexcept
    {
        return m_frame;
    }

  private:
    // Private utility methods
    void InitGraphics(uint32_t surfaceWidth, uint32_t surfaceHeight);
    void ConfigureSurface(uint32_t width, uint32_t height);
    void CreateTexture();
    void CreateSampler();
    void CreateUniformBuffer();
    void CreateBindGroup();
    void CreateRenderPipeline();
    void CreateRenderPassDescriptor();
    void UploadFrame() const;
    void UpdateUniforms() const;
    void GetAdapter(const std::function<void(wgpu::Adapter)> &callback);
    void GetDevice(const std::function<void(wgpu::Device)> &callback);
    std::string LoadShaderFile(const std::string &filepath) const;

    // Types
    struct Uniforms
    {
        alignas(16) glm::mat4 transform;
    };

    // Pixel data
    PixelBuffer m_frame;
    ScalingTransform m_scaling;
    glm::dvec4 m_clearColor;
    uint32_t m_surfaceWidth = 0;
    uint32_t m_surfaceHeight = 0;

    // WebGPU resources
    wgpu::Instance m_instance;
    wgpu::Adapter m_adapter;
    wgpu::Device m_device;
    wgpu::Surface m_surface;
    wgpu::TextureFormat m_surfaceFormat = wgpu::TextureFormat::Undefined;
    wgpu::RenderPassDescriptor m_renderPassDescriptor{};
    wgpu::RenderPassColorAttachment m_colorAttachment{};

    wgpu::Texture m_texture;
    wgpu::TextureView m_textureView;
    wgpu::Sampler m_sampler;
    wgpu::Buffer m_uniformBuffer;
    wgpu::BindGroupLayout m_bindGroupLayout;
    wgpu::BindGroup m_bindGroup;
    wgpu::ShaderModule m_shaderModule;
    wgpu::RenderPipeline m_pipeline;
};
