#pragma once

#include <array>

struct GLFWwindow;

namespace engine::platform
{
/// Keyboard state with one frame of history for edge detection.
class Input
{
public:
    static constexpr int kMaxKeys = 512;

    /// Shifts the current frame into history and samples every key from window.
    void Update(GLFWwindow* window);

    /// Shifts the current frame into history without sampling; pair with SetKeyState.
    void BeginFrame();
    void SetKeyState(int key, bool down);

    [[nodiscard]] bool IsKeyDown(int key) const;
    [[nodiscard]] bool IsKeyPressed(int key) const;
    [[nodiscard]] bool IsKeyReleased(int key) const;

private:
    [[nodiscard]] static bool InRange(int key) { return key >= 0 && key < kMaxKeys; }

    std::array<unsigned char, kMaxKeys> m_currentKeys{};
    std::array<unsigned char, kMaxKeys> m_previousKeys{};
};
} // namespace engine::platform
