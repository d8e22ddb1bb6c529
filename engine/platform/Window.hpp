#pragma once

#include <functional>
#include <string>

struct GLFWwindow;

namespace engine::platform
{
struct WindowSettings
{
    int width = 960;
    int height = 540;
    float windowScale = 1.0F;
    bool vsync = true;
    std::string title = "Fractured Forest";
};

class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;

    [[nodiscard]] bool ShouldClose() const;
    void SetShouldClose(bool shouldClose) const;
    void SetTitle(const std::string& title) const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] double NowSeconds() const;

    void SetVSync(bool enabled) const;

    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }

    void SetResizeCallback(std::function<void(int, int)> callback);

private:
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);

    GLFWwindow* m_window = nullptr;
    std::function<void(int, int)> m_resizeCallback;

    int m_fbWidth = 960;
    int m_fbHeight = 540;
};
} // namespace engine::platform
