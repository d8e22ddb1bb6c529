#include "engine/platform/Input.hpp"

#include <cstddef>

#include <GLFW/glfw3.h>

namespace engine::platform
{
void Input::Update(GLFWwindow* window)
{
    BeginFrame();

    // GLFW key codes start at GLFW_KEY_SPACE; lower values are not valid keys.
    for (int key = GLFW_KEY_SPACE; key < kMaxKeys && key <= GLFW_KEY_LAST; ++key)
    {
        SetKeyState(key, glfwGetKey(window, key) == GLFW_PRESS);
    }
}

void Input::BeginFrame()
{
    m_previousKeys = m_currentKeys;
}

void Input::SetKeyState(int key, bool down)
{
    if (!InRange(key))
    {
        return;
    }
    m_currentKeys[static_cast<std::size_t>(key)] = static_cast<unsigned char>(down);
}

bool Input::IsKeyDown(int key) const
{
    if (!InRange(key))
    {
        return false;
    }
    return m_currentKeys[static_cast<std::size_t>(key)] != 0;
}

bool Input::IsKeyPressed(int key) const
{
    if (!InRange(key))
    {
        return false;
    }
    const std::size_t index = static_cast<std::size_t>(key);
    return m_currentKeys[index] != 0 && m_previousKeys[index] == 0;
}

bool Input::IsKeyReleased(int key) const
{
    if (!InRange(key))
    {
        return false;
    }
    const std::size_t index = static_cast<std::size_t>(key);
    return m_currentKeys[index] == 0 && m_previousKeys[index] != 0;
}
} // namespace engine::platform
