#include "engine/render/Renderer.hpp"

#include <algorithm>
#include <cmath>

#include <GLFW/glfw3.h>

namespace engine::render
{
bool Renderer::Initialize(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight)
{
    if (logicalWidth <= 0 || logicalHeight <= 0)
    {
        return false;
    }

    m_logicalSize = {logicalWidth, logicalHeight};
    m_commands.reserve(256);
    SetViewport(framebufferWidth, framebufferHeight);
    glDisable(GL_DEPTH_TEST);
    m_initialized = true;
    return true;
}

void Renderer::Shutdown()
{
    m_commands.clear();
    m_initialized = false;
}

void Renderer::SetViewport(int framebufferWidth, int framebufferHeight)
{
    m_framebufferSize = {std::max(1, framebufferWidth), std::max(1, framebufferHeight)};
    glViewport(0, 0, m_framebufferSize.x, m_framebufferSize.y);
}

void Renderer::BeginFrame(const glm::vec3& clearColor)
{
    m_clearColor = clearColor;
    m_commands.clear();
}

void Renderer::DrawRect(const physics::Rect& rect, const glm::vec3& color)
{
    if (rect.IsEmpty())
    {
        return;
    }
    m_commands.push_back(RectCommand{rect, color});
}

void Renderer::EndFrame()
{
    if (!m_initialized)
    {
        return;
    }

    glDisable(GL_SCISSOR_TEST);
    glClearColor(m_clearColor.r, m_clearColor.g, m_clearColor.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);

    // Axis-aligned solid fills only need a scissored clear; no shaders or buffers.
    glEnable(GL_SCISSOR_TEST);
    for (const RectCommand& command : m_commands)
    {
        FillFramebufferRect(command.rect, command.color);
    }
    glDisable(GL_SCISSOR_TEST);
}

void Renderer::FillFramebufferRect(const physics::Rect& rect, const glm::vec3& color) const
{
    const float scaleX = static_cast<float>(m_framebufferSize.x) / static_cast<float>(m_logicalSize.x);
    const float scaleY = static_cast<float>(m_framebufferSize.y) / static_cast<float>(m_logicalSize.y);

    const int left = static_cast<int>(std::floor(static_cast<float>(rect.Left()) * scaleX));
    const int right = static_cast<int>(std::ceil(static_cast<float>(rect.Right()) * scaleX));
    const int top = static_cast<int>(std::floor(static_cast<float>(rect.Top()) * scaleY));
    const int bottom = static_cast<int>(std::ceil(static_cast<float>(rect.Bottom()) * scaleY));

    // GL scissor origin is bottom-left; the logical space is top-left with y down.
    const int glY = m_framebufferSize.y - bottom;
    glScissor(left, glY, std::max(0, right - left), std::max(0, bottom - top));
    glClearColor(color.r, color.g, color.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);
}
} // namespace engine::render
