#pragma once

#include <cstddef>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/physics/Rect.hpp"

namespace engine::physics
{
enum class TriggerKind
{
    Hazard,
    Water,
    Wind,
    Exit
};

struct TriggerVolume
{
    Rect bounds;
    TriggerKind kind = TriggerKind::Hazard;
};

struct MoveResult
{
    Rect box;
    glm::vec2 velocity{0.0F};
    bool grounded = false;
    bool collidedHorizontal = false;
    bool collidedVertical = false;
};

/// Flat collection of solid rectangles and non-blocking trigger volumes.
/// Movement is resolved one axis at a time: the horizontal pass is fully
/// completed against the post-move position before any vertical movement.
class PhysicsWorld
{
public:
    void Clear();

    void AddSolidBox(const Rect& box);
    void AddTrigger(const TriggerVolume& trigger);

    [[nodiscard]] const std::vector<Rect>& Solids() const { return m_solids; }
    [[nodiscard]] const std::vector<TriggerVolume>& Triggers() const { return m_triggers; }

    /// Runs the horizontal pass, then the vertical pass. Velocity is only
    /// altered on the vertical axis (zeroed on contact).
    [[nodiscard]] MoveResult MoveBox(const Rect& box, const glm::vec2& velocity) const;

    /// Adds rounded velocityX to the box and pushes it out of every overlapped solid.
    void MoveHorizontal(MoveResult& state) const;

    /// Adds rounded velocityY to the box, clears grounded and snaps to overlapped solids.
    void MoveVertical(MoveResult& state) const;

    [[nodiscard]] bool OverlapsSolid(const Rect& box) const;
    [[nodiscard]] std::size_t CountTriggers(const Rect& box, TriggerKind kind) const;
    [[nodiscard]] bool OverlapsTrigger(const Rect& box, TriggerKind kind) const
    {
        return CountTriggers(box, kind) > 0;
    }

    /// Converts a fractional velocity to a whole-pixel displacement, ties to even.
    [[nodiscard]] static int RoundToPixels(float value);

private:
    std::vector<Rect> m_solids;
    std::vector<TriggerVolume> m_triggers;
};
} // namespace engine::physics
