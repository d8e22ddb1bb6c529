#pragma once

#include <algorithm>

#include <glm/vec2.hpp>

namespace engine::physics
{
/// Integer axis-aligned rectangle in screen space (y grows downward).
struct Rect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    [[nodiscard]] int Left() const { return x; }
    [[nodiscard]] int Right() const { return x + w; }
    [[nodiscard]] int Top() const { return y; }
    [[nodiscard]] int Bottom() const { return y + h; }
    [[nodiscard]] glm::ivec2 Position() const { return {x, y}; }
    [[nodiscard]] glm::ivec2 Size() const { return {w, h}; }

    void SetLeft(int value) { x = value; }
    void SetRight(int value) { x = value - w; }
    void SetTop(int value) { y = value; }
    void SetBottom(int value) { y = value - h; }

    [[nodiscard]] bool IsEmpty() const { return w <= 0 || h <= 0; }

    /// True when the two rectangles share a non-empty area. Touching edges do not overlap.
    [[nodiscard]] bool Overlaps(const Rect& other) const
    {
        if (IsEmpty() || other.IsEmpty())
        {
            return false;
        }
        return x < other.Right() && Right() > other.x && y < other.Bottom() && Bottom() > other.y;
    }

    /// Moves this rectangle inside bounds. A rectangle larger than bounds on an axis is centered on it.
    void ClampInside(const Rect& bounds)
    {
        if (w >= bounds.w)
        {
            x = bounds.x + bounds.w / 2 - w / 2;
        }
        else
        {
            x = std::clamp(x, bounds.x, bounds.Right() - w);
        }

        if (h >= bounds.h)
        {
            y = bounds.y + bounds.h / 2 - h / 2;
        }
        else
        {
            y = std::clamp(y, bounds.y, bounds.Bottom() - h);
        }
    }

    [[nodiscard]] bool operator==(const Rect& other) const
    {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
};
} // namespace engine::physics
