// Standard Library Headers
#include <cassert>
#include <cmath>
#include <iostream>

// Third-Party Library Headers
#include <GLFW/glfw3.h>

// Project Headers
#include "application.h"
#include "key_names.h"

// Static Application Instance
Application *Application::s_instance = nullptr;

//----------------------------------------------------------------------
// Internal Utility Functions

namespace {

void ErrorCallback(int error, const char *description) {
    std::cerr << "GLFW error " << error << ": " << (description ? description : "unknown") << std::endl;
}

void CursorPositionCallback([[maybe_unused]] GLFWwindow *window, double xpos, double ypos) {
    Application::GetInstance()->OnCursorMoved(xpos, ypos);
}

void MouseButtonCallback([[maybe_unused]] GLFWwindow *window, int button, int action,
                         [[maybe_unused]] int mods) {
    Application::GetInstance()->OnMouseButton(button, action);
}

void KeyCallback([[maybe_unused]] GLFWwindow *window, int key, int scancode, int action,
                 [[maybe_unused]] int mods) {
    Application::GetInstance()->OnKey(key, scancode, action);
}

} // namespace

//----------------------------------------------------------------------
// Application Class Implementation

Application *Application::GetInstance() {
    return s_instance;
}

Application::Application(const AppConfig& config, EventObserver& observer)
    : m_config(config), m_observer(observer), m_timer(config.tickInterval) {
    assert(!s_instance); // Ensure only one instance exists
    s_instance = this;
}

Application::~Application() {
    // The surface must go before the window it presents to
    m_pixels.reset();

    if (m_window) {
        glfwDestroyWindow(m_window);
    }
    if (m_glfwInitialized) {
        glfwTerminate();
    }
    s_instance = nullptr;
}

bool Application::Run() {
    glfwSetErrorCallback(ErrorCallback);
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW." << std::endl;
        return false;
    }
    m_glfwInitialized = true;

    // Sizes are logical; let the window follow the monitor content scale
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);
    m_window = glfwCreateWindow(static_cast<int>(m_config.windowWidth), static_cast<int>(m_config.windowHeight),
                                m_config.title.c_str(), nullptr, nullptr);
    if (!m_window) {
        std::cerr << "Failed to create window." << std::endl;
        return false;
    }

    // The window may not shrink below the pixel buffer. Limits are in screen
    // coordinates, which are either logical or already content-scaled.
    int windowWidth = 0;
    int windowHeight = 0;
    glfwGetWindowSize(m_window, &windowWidth, &windowHeight);
    const double screenScale = static_cast<double>(windowWidth) / m_config.windowWidth;
    glfwSetWindowSizeLimits(m_window, static_cast<int>(std::ceil(m_config.pixelsWidth * screenScale)),
                            static_cast<int>(std::ceil(m_config.pixelsHeight * screenScale)), GLFW_DONT_CARE,
                            GLFW_DONT_CARE);

    // Setup input callbacks
    glfwSetCursorPosCallback(m_window, CursorPositionCallback);
    glfwSetMouseButtonCallback(m_window, MouseButtonCallback);
    glfwSetKeyCallback(m_window, KeyCallback);
    glfwSetFramebufferSizeCallback(m_window,
                                   []([[maybe_unused]] GLFWwindow *window, int width, int height) {
                                       Application::GetInstance()->OnResize(width, height);
                                   });
    glfwSetWindowRefreshCallback(m_window, []([[maybe_unused]] GLFWwindow *window) {
        Application::GetInstance()->RequestRedraw();
    });

    // The pixel surface is sized in physical pixels
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    glfwGetFramebufferSize(m_window, &framebufferWidth, &framebufferHeight);

    m_pixels = std::make_unique<Pixels>(m_config.pixelsWidth, m_config.pixelsHeight, m_config.clearColor);
    m_pixels->Initialize(m_window, static_cast<uint32_t>(framebufferWidth),
                         static_cast<uint32_t>(framebufferHeight), [this]() { MainLoop(); });

    return !m_renderFailed;
}

void Application::MainLoop() {
    // Start the timer
    m_timer.Arm(FixedTimer::Clock::now());
    RequestRedraw();

    while (!glfwWindowShouldClose(m_window) && !m_renderFailed) {
        // Wait for events, but no longer than the next tick
        const double timeout = m_timer.SecondsUntilDeadline(FixedTimer::Clock::now());
        if (timeout > 0.0) {
            glfwWaitEventsTimeout(timeout);
        } else {
            glfwPollEvents();
        }

        // Publish this batch of input to the update hook
        m_input.Commit();

        if (m_timer.IsDue(FixedTimer::Clock::now())) {
            ProcessTick();
        }

        if (m_redrawRequested) {
            ProcessRedraw();
        }
    }
}

void Application::ProcessTick() {
    m_world.Update(m_input.GetState());
    RequestRedraw();

    // Rearm from now; time spent in the tick is not made up
    m_timer.Arm(FixedTimer::Clock::now());
}

void Application::ProcessRedraw() {
    m_redrawRequested = false;

    // Draw into the pixel buffer, then present it scaled into the window
    m_world.Draw(m_pixels->Frame());
    if (!m_pixels->Render()) {
        std::cerr << "Rendering failed, exiting." << std::endl;
        m_renderFailed = true;
    }
}

void Application::RequestRedraw() {
    m_redrawRequested = true;
}

void Application::OnCursorMoved(double xpos, double ypos) {
    m_input.OnCursorMoved(ToPhysical(xpos, ypos));
}

void Application::OnMouseButton(int button, int action) {
    if (!m_pixels) {
        return;
    }

    const bool pressed = action == GLFW_PRESS;
    m_input.OnMouseButton(button, pressed);

    if (button == GLFW_MOUSE_BUTTON_LEFT && pressed) {
        const glm::dvec2 position = m_input.GetPendingState().cursorPosition;
        glm::ivec2 pixel(0);
        const bool inside = m_pixels->WindowPosToPixel(glm::vec2(position), pixel);
        m_observer.OnMouseClicked(position, inside, pixel);
    }
}

void Application::OnKey(int key, int scancode, int action) {
    KeyEvent event;
    event.key = key;
    event.scancode = scancode;
    event.name = KeyDisplayName(key, scancode, glfwGetKeyName(key, scancode));
    event.pressed = action != GLFW_RELEASE;
    event.repeat = action == GLFW_REPEAT;

    m_input.OnKey(key, event.pressed);
    m_observer.OnKey(event);
}

void Application::OnResize(int width, int height) {
    if (!m_pixels) {
        return;
    }

    m_observer.OnResized(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    m_pixels->ResizeSurface(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    RequestRedraw();
}

glm::dvec2 Application::ToPhysical(double xpos, double ypos) const {
    // Cursor positions arrive in screen coordinates
    int windowWidth = 0;
    int windowHeight = 0;
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    glfwGetWindowSize(m_window, &windowWidth, &windowHeight);
    glfwGetFramebufferSize(m_window, &framebufferWidth, &framebufferHeight);

    if (windowWidth <= 0 || windowHeight <= 0) {
        return glm::dvec2(xpos, ypos);
    }

    return glm::dvec2(xpos * framebufferWidth / windowWidth, ypos * framebufferHeight / windowHeight);
}
