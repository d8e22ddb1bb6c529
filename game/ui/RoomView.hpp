#pragma once

#include <vector>

#include <glm/vec3.hpp>

#include "engine/physics/Rect.hpp"
#include "game/gameplay/RunState.hpp"

namespace game::ui
{
struct ColoredRect
{
    engine::physics::Rect rect;
    glm::vec3 color{1.0F};
};

/// One frame of flat geometry, back to front.
struct RoomFrame
{
    glm::vec3 clearColor{0.0F};
    std::vector<ColoredRect> rects;
};

/// Turns a run snapshot into colored rectangles. Holds no GL state so it can
/// be exercised without a window.
class RoomView
{
public:
    [[nodiscard]] RoomFrame Compose(const gameplay::RunSnapshot& snapshot) const;

    [[nodiscard]] static glm::vec3 SeasonAccent(world::Season season);
    [[nodiscard]] static glm::vec3 SeasonBackground(world::Season season);

    /// Blends the season background toward its accent by flashIntensity / 255.
    [[nodiscard]] static glm::vec3 FlashedBackground(world::Season season, int flashIntensity);

private:
    static void AddOutlined(RoomFrame& frame, const engine::physics::Rect& rect, const glm::vec3& fill, const glm::vec3& edge);
    static void AddHud(RoomFrame& frame, const gameplay::RunSnapshot& snapshot);
    static void AddEndBanner(RoomFrame& frame, const gameplay::RunSnapshot& snapshot);
};
} // namespace game::ui
