#include "engine/platform/Window.hpp"

#include <iostream>

#include <GLFW/glfw3.h>

namespace engine::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    const int width = static_cast<int>(static_cast<float>(settings.width) * settings.windowScale);
    const int height = static_cast<int>(static_cast<float>(settings.height) * settings.windowScale);
    m_window = glfwCreateWindow(width, height, settings.title.c_str(), nullptr, nullptr);

    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);

    SetVSync(settings.vsync);
    return true;
}

void Window::Shutdown()
{
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetShouldClose(bool shouldClose) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowShouldClose(m_window, shouldClose ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetTitle(const std::string& title) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowTitle(m_window, title.c_str());
    }
}

double Window::NowSeconds() const
{
    return glfwGetTime();
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

void Window::SetResizeCallback(std::function<void(int, int)> callback)
{
    m_resizeCallback = std::move(callback);
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_fbWidth = width;
    self->m_fbHeight = height;
    if (self->m_resizeCallback)
    {
        self->m_resizeCallback(width, height);
    }
}
} // namespace engine::platform
