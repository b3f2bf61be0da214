// Standard Library Headers
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

// Third-Party Library Headers
#include <webgpu/webgpu_glfw.h>

// Project Headers
#include "pixels.h"

//----------------------------------------------------------------------
// Internal Utility Functions

namespace
{

constexpr const char *kShaderPath = "./assets/shaders/pixels.wgsl";

bool IsSrgbFormat(wgpu::TextureFormat format)
{
    return format == wgpu::TextureFormat::BGRA8UnormSrgb || format == wgpu::TextureFormat::RGBA8UnormSrgb;
}

} // namespace

//----------------------------------------------------------------------
// Pixels Class implementation

Pixels::Pixels(uint32_t width, uint32_t height, const glm::dvec4 &clearColor)
    : m_frame(width, height), m_scaling({width, height}, {width, height}), m_clearColor(clearColor)
{
}

void Pixels::Initialize(GLFWwindow *window, uint32_t surfaceWidth, uint32_t surfaceHeight,
                        const std::function<void()> &callback)
{
    m_instance = wgpu::CreateInstance();
    m_surface = wgpu::glfw::CreateSurfaceForWindow(m_instance, window);
    if (!m_surface)
    {
        std::cerr << "Failed to create a WebGPU surface for the window." << std::endl;
        std::exit(EXIT_FAILURE);
    }

    GetAdapter([this, callback, surfaceWidth, surfaceHeight](wgpu::Adapter adapter) {
        m_adapter = adapter;
        GetDevice([this, callback, surfaceWidth, surfaceHeight](wgpu::Device device) {
            m_device = device;

            InitGraphics(surfaceWidth, surfaceHeight);

            // Return control to the application
            callback();
        });
    });
}

void Pixels::ResizeSurface(uint32_t width, uint32_t height)
{
    m_surfaceWidth = width;
    m_surfaceHeight = height;

    // A minimized window has no surface to configure
    if (width == 0 || height == 0)
    {
        return;
    }

    ConfigureSurface(width, height);

    m_scaling = ScalingTransform({m_frame.GetWidth(), m_frame.GetHeight()}, {width, height});
    UpdateUniforms();
}

bool Pixels::Render()
{
    if (m_surfaceWidth == 0 || m_surfaceHeight == 0)
    {
        return true;
    }

    UploadFrame();

    // Get the current surface texture; an outdated surface gets one reconfigure
    wgpu::SurfaceTexture surfaceTexture;
    m_surface.GetCurrentTexture(&surfaceTexture);
    if (!surfaceTexture.texture)
    {
        ConfigureSurface(m_surfaceWidth, m_surfaceHeight);
        m_surface.GetCurrentTexture(&surfaceTexture);
        if (!surfaceTexture.texture)
        {
            std::cerr << "Error: Failed to get current surface texture." << std::endl;
            return false;
        }
    }
    m_colorAttachment.view = surfaceTexture.texture.CreateView();

    // Clear the whole surface, then draw the scaled image inside the clip rect
    wgpu::CommandEncoder encoder = m_device.CreateCommandEncoder();
    wgpu::RenderPassEncoder pass = encoder.BeginRenderPass(&m_renderPassDescriptor);

    const ScalingTransform::ClipRect &clip = m_scaling.GetClipRect();
    pass.SetPipeline(m_pipeline);
    pass.SetBindGroup(0, m_bindGroup);
    pass.SetScissorRect(clip.x, clip.y, clip.width, clip.height);
    pass.Draw(3, 1, 0, 0); // Fullscreen triangle
    pass.End();

    wgpu::CommandBuffer commands = encoder.Finish();
    m_device.GetQueue().Submit(1, &commands);

    // Present the surface
    m_surface.Present();
    m_instance.ProcessEvents();

    return true;
}

bool Pixels::WindowPosToPixel(const glm::vec2 &physicalPosition, glm::ivec2 &pixel) const noexcept
{
    return m_scaling.WindowPosToPixel(physicalPosition, pixel);
}

void Pixels::InitGraphics(uint32_t surfaceWidth, uint32_t surfaceHeight)
{
    m_surfaceWidth = surfaceWidth;
    m_surfaceHeight = surfaceHeight;
    m_scaling = ScalingTransform({m_frame.GetWidth(), m_frame.GetHeight()}, {surfaceWidth, surfaceHeight});

    ConfigureSurface(surfaceWidth, surfaceHeight);

    CreateTexture();
    CreateSampler();
    CreateUniformBuffer();
    CreateBindGroup();
    CreateRenderPipeline();
    CreateRenderPassDescriptor();
}

void Pixels::ConfigureSurface(uint32_t width, uint32_t height)
{
    // Prefer an sRGB surface format, fall back to the first supported one
    if (m_surfaceFormat == wgpu::TextureFormat::Undefined)
    {
        wgpu::SurfaceCapabilities capabilities;
        m_surface.GetCapabilities(m_adapter, &capabilities);
        if (capabilities.formatCount == 0)
        {
            std::cerr << "Surface reports no supported formats." << std::endl;
            std::exit(EXIT_FAILURE);
        }

        m_surfaceFormat = capabilities.formats[0];
        for (size_t i = 0; i < capabilities.formatCount; ++i)
        {
            if (IsSrgbFormat(capabilities.formats[i]))
            {
                m_surfaceFormat = capabilities.formats[i];
                break;
            }
        }
    }

    // Zero-sized surfaces are not allowed
    if (width == 0 || height == 0)
    {
        return;
    }

    wgpu::SurfaceConfiguration config{};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.width = width;
    config.height = height;
    m_surface.Configure(&config);
}

void Pixels::CreateTexture()
{
    // Match the surface so bytes reach the screen unchanged
    const wgpu::TextureFormat format =
        IsSrgbFormat(m_surfaceFormat) ? wgpu::TextureFormat::RGBA8UnormSrgb : wgpu::TextureFormat::RGBA8Unorm;

    wgpu::TextureDescriptor textureDescriptor{};
    textureDescriptor.size = {m_frame.GetWidth(), m_frame.GetHeight(), 1};
    textureDescriptor.format = format;
    textureDescriptor.usage = wgpu::TextureUsage::TextureBinding | wgpu::TextureUsage::CopyDst;
    textureDescriptor.mipLevelCount = 1;

    m_texture = m_device.CreateTexture(&textureDescriptor);
    m_textureView = m_texture.CreateView();
}

void Pixels::CreateSampler()
{
    wgpu::SamplerDescriptor samplerDescriptor{};
    samplerDescriptor.addressModeU = wgpu::AddressMode::ClampToEdge;
    samplerDescriptor.addressModeV = wgpu::AddressMode::ClampToEdge;
    samplerDescriptor.addressModeW = wgpu::AddressMode::ClampToEdge;
    samplerDescriptor.minFilter = wgpu::FilterMode::Nearest;
    samplerDescriptor.magFilter = wgpu::FilterMode::Nearest;
    samplerDescriptor.mipmapFilter = wgpu::MipmapFilterMode::Nearest;
    m_sampler = m_device.CreateSampler(&samplerDescriptor);
}

void Pixels::CreateUniformBuffer()
{
    wgpu::BufferDescriptor bufferDescriptor{};
    bufferDescriptor.size = sizeof(Uniforms);
    bufferDescriptor.usage = wgpu::BufferUsage::Uniform | wgpu::BufferUsage::CopyDst;

    m_uniformBuffer = m_device.CreateBuffer(&bufferDescriptor);

    UpdateUniforms();
}

void Pixels::CreateBindGroup()
{
    wgpu::BindGroupLayoutEntry layoutEntries[3]{};

    // 0: Pixel texture
    layoutEntries[0].binding = 0;
    layoutEntries[0].visibility = wgpu::ShaderStage::Fragment;
    layoutEntries[0].texture.sampleType = wgpu::TextureSampleType::Float;
    layoutEntries[0].texture.viewDimension = wgpu::TextureViewDimension::e2D;
    layoutEntries[0].texture.multisampled = false;

    // 1: Sampler
    layoutEntries[1].binding = 1;
    layoutEntries[1].visibility = wgpu::ShaderStage::Fragment;
    layoutEntries[1].sampler.type = wgpu::SamplerBindingType::Filtering;

    // 2: Scaling transform
    layoutEntries[2].binding = 2;
    layoutEntries[2].visibility = wgpu::ShaderStage::Vertex;
    layoutEntries[2].buffer.type = wgpu::BufferBindingType::Uniform;
    layoutEntries[2].buffer.hasDynamicOffset = false;
    layoutEntries[2].buffer.minBindingSize = sizeof(Uniforms);

    wgpu::BindGroupLayoutDescriptor bindGroupLayoutDescriptor{};
    bindGroupLayoutDescriptor.entryCount = 3;
    bindGroupLayoutDescriptor.entries = layoutEntries;
    m_bindGroupLayout = m_device.CreateBindGroupLayout(&bindGroupLayoutDescriptor);

    wgpu::BindGroupEntry bindGroupEntries[3]{};
    bindGroupEntries[0].binding = 0;
    bindGroupEntries[0].textureView = m_textureView;
    bindGroupEntries[1].binding = 1;
    bindGroupEntries[1].sampler = m_sampler;
    bindGroupEntries[2].binding = 2;
    bindGroupEntries[2].buffer = m_uniformBuffer;
    bindGroupEntries[2].offset = 0;
    bindGroupEntries[2].size = sizeof(Uniforms);

    wgpu::BindGroupDescriptor bindGroupDescriptor{};
    bindGroupDescriptor.layout = m_bindGroupLayout;
    bindGroupDescriptor.entryCount = 3;
    bindGroupDescriptor.entries = bindGroupEntries;
    m_bindGroup = m_device.CreateBindGroup(&bindGroupDescriptor);
}

void Pixels::CreateRenderPipeline()
{
    const std::string shaderCode = LoadShaderFile(kShaderPath);

    wgpu::ShaderSourceWGSL wgsl{{.nextInChain = nullptr, .code = shaderCode.c_str()}};
    wgpu::ShaderModuleDescriptor shaderModuleDescriptor{.nextInChain = &wgsl};
    m_shaderModule = m_device.CreateShaderModule(&shaderModuleDescriptor);

    wgpu::BindGroupLayout bindGroupLayouts[] = {m_bindGroupLayout};
    wgpu::PipelineLayoutDescriptor layoutDescriptor{};
    layoutDescriptor.bindGroupLayoutCount = 1;
    layoutDescriptor.bindGroupLayouts = bindGroupLayouts;
    wgpu::PipelineLayout pipelineLayout = m_device.CreatePipelineLayout(&layoutDescriptor);

    wgpu::ColorTargetState colorTargetState{};
    colorTargetState.format = m_surfaceFormat;

    wgpu::FragmentState fragmentState{};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = "fs_main";
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTargetState;

    wgpu::RenderPipelineDescriptor descriptor{};
    descriptor.layout = pipelineLayout;
    descriptor.vertex.module = m_shaderModule;
    descriptor.vertex.entryPoint = "vs_main";
    descriptor.vertex.bufferCount = 0;
    descriptor.vertex.buffers = nullptr; // Vertices encoded in shader
    descriptor.primitive.topology = wgpu::PrimitiveTopology::TriangleList;
    descriptor.fragment = &fragmentState;

    m_pipeline = m_device.CreateRenderPipeline(&descriptor);
}

void Pixels::CreateRenderPassDescriptor()
{
    m_colorAttachment.loadOp = wgpu::LoadOp::Clear;
    m_colorAttachment.storeOp = wgpu::StoreOp::Store;
    m_colorAttachment.clearValue = {.r = m_clearColor.r, .g = m_clearColor.g, .b = m_clearColor.b, .a = m_clearColor.a};

    m_renderPassDescriptor.colorAttachmentCount = 1;
    m_renderPassDescriptor.colorAttachments = &m_colorAttachment;
}

void Pixels::UploadFrame() const
{
    wgpu::ImageCopyTexture imageCopyTexture{};
    imageCopyTexture.texture = m_texture;
    imageCopyTexture.mipLevel = 0;
    imageCopyTexture.origin = {0, 0, 0};
    imageCopyTexture.aspect = wgpu::TextureAspect::All;

    wgpu::TextureDataLayout source{};
    source.offset = 0;
    source.bytesPerRow = m_frame.GetBytesPerRow();
    source.rowsPerImage = m_frame.GetHeight();

    wgpu::Extent3D size = {m_frame.GetWidth(), m_frame.GetHeight(), 1};
    m_device.GetQueue().WriteTexture(&imageCopyTexture, m_frame.GetData(), m_frame.GetSizeInBytes(), &source, &size);
}

void Pixels::UpdateUniforms() const
{
    if (!m_uniformBuffer)
    {
        return;
    }

    Uniforms uniforms;
    uniforms.transform = m_scaling.GetMatrix();
    m_device.GetQueue().WriteBuffer(m_uniformBuffer, 0, &uniforms, sizeof(Uniforms));
}

void Pixels::GetAdapter(const std::function<void(wgpu::Adapter)> &callback)
{
    wgpu::RequestAdapterOptions options{};
    options.compatibleSurface = m_surface;

    m_instance.RequestAdapter(
        &options,
        [](WGPURequestAdapterStatus status, WGPUAdapter cAdapter, const char *message, void *userdata) {
            if (message)
            {
                std::cerr << "RequestAdapter: " << message << std::endl;
            }
            if (status != WGPURequestAdapterStatus_Success)
            {
                std::cerr << "Failed to request adapter." << std::endl;
                std::exit(EXIT_FAILURE);
            }
            wgpu::Adapter adapter = wgpu::Adapter::Acquire(cAdapter);
            auto cb = *static_cast<std::function<void(wgpu::Adapter)> *>(userdata);
            delete static_cast<std::function<void(wgpu::Adapter)> *>(userdata);
            cb(adapter);
        },
        new std::function<void(wgpu::Adapter)>(callback));
}

void Pixels::GetDevice(const std::function<void(wgpu::Device)> &callback)
{
    wgpu::DeviceDescriptor deviceDesc;

    deviceDesc.SetDeviceLostCallback(
        wgpu::CallbackMode::AllowSpontaneous,
        []([[maybe_unused]] const wgpu::Device &device, wgpu::DeviceLostReason reason, const char *message) {
            // Dropping the device on shutdown is expected
            if (reason == wgpu::DeviceLostReason::Destroyed || reason == wgpu::DeviceLostReason::InstanceDropped)
            {
                return;
            }
            std::cerr << "Device lost: " << (message ? message : "No message provided.") << std::endl;
        });

    deviceDesc.SetUncapturedErrorCallback(
        []([[maybe_unused]] const wgpu::Device &device, [[maybe_unused]] wgpu::ErrorType type, const char *message) {
            std::cerr << "Uncaptured error: " << (message ? message : "No message provided.") << std::endl;
            std::exit(EXIT_FAILURE);
        });

    m_adapter.RequestDevice(
        &deviceDesc,
        [](WGPURequestDeviceStatus status, WGPUDevice cDevice, const char *message, void *userdata) {
            if (message)
            {
                std::cerr << "RequestDevice: " << message << std::endl;
            }
            if (status != WGPURequestDeviceStatus_Success)
            {
                std::cerr << "Failed to request device." << std::endl;
                std::exit(EXIT_FAILURE);
            }
            wgpu::Device device = wgpu::Device::Acquire(cDevice);
            auto cb = *static_cast<std::function<void(wgpu::Device)> *>(userdata);
            delete static_cast<std::function<void(wgpu::Device)> *>(userdata);
            cb(device);
        },
        new std::function<void(wgpu::Device)>(callback));
}

std::string Pixels::LoadShaderFile(const std::string &filepath) const
{
    std::ifstream file(filepath, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        std::cerr << "Failed to open shader file: " + filepath << std::endl;
        return "";
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
