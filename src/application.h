#pragma once

// Standard Library Headers
#include <cstdint>
#include <memory>

// Third-Party Library Headers
#include <glm/glm.hpp>

// Project Headers
#include "app_config.h"
#include "event_observer.h"
#include "fixed_timer.h"
#include "input_state.h"
#include "pixels.h"
#include "world.h"

// Forward Declarations
struct GLFWwindow;

// Application Class
class Application {
  public:
    // Static Instance Getter
    static Application *GetInstance();

    // Constructor and Destructor
    Application(const AppConfig& config, EventObserver& observer);
    ~Application();

    // Deleted Functions
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    // Public Interface
    bool Run();
    void OnCursorMoved(double xpos, double ypos);
    void OnMouseButton(int button, int action);
    void OnKey(int key, int scancode, int action);
    void OnResize(int width, int height);
    void RequestRedraw();

  private:
    // Private Member Functions
    void MainLoop();
    void ProcessTick();
    void ProcessRedraw();
    glm::dvec2 ToPhysical(double xpos, double ypos) const;

    // Static Instance
    static Application *s_instance;

    // Private Member Variables
    AppConfig m_config;
    EventObserver& m_observer; // Non-owning
    bool m_glfwInitialized = false;
    bool m_redrawRequested = false;
    bool m_renderFailed = false;

    GLFWwindow *m_window = nullptr;
    std::unique_ptr<Pixels> m_pixels;
    World m_world;
    InputTracker m_input;
    FixedTimer m_timer;
};
