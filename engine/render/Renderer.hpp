#pragma once

#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/physics/Rect.hpp"

namespace engine::render
{
/// Flat 2D rectangle renderer. Draw calls are queued in a fixed logical
/// resolution and scaled to the framebuffer when the frame ends.
class Renderer
{
public:
    bool Initialize(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight);
    void Shutdown();

    void SetViewport(int framebufferWidth, int framebufferHeight);

    void BeginFrame(const glm::vec3& clearColor);
    void EndFrame();

    void DrawRect(const physics::Rect& rect, const glm::vec3& color);

private:
    struct RectCommand
    {
        physics::Rect rect;
        glm::vec3 color{1.0F};
    };

    void FillFramebufferRect(const physics::Rect& rect, const glm::vec3& color) const;

    std::vector<RectCommand> m_commands;
    glm::vec3 m_clearColor{0.0F};
    glm::ivec2 m_framebufferSize{960, 540};
    glm::ivec2 m_logicalSize{960, 540};
    bool m_initialized = false;
};
} // namespace engine::render
