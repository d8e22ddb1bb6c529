#pragma once

#include <glm/vec2.hpp>

#include "engine/physics/Rect.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/Modifiers.hpp"
#include "game/world/RoomGeometry.hpp"
#include "game/world/Season.hpp"

namespace game::gameplay
{
struct Actor
{
    engine::physics::Rect box;
    glm::vec2 velocity{0.0F, 0.0F};
    bool grounded = false;

    void ResetTo(const engine::physics::Rect& spawnBox)
    {
        box = spawnBox;
        velocity = glm::vec2{0.0F, 0.0F};
        grounded = false;
    }
};

/// Held movement keys for one frame. Holding both directions cancels out.
struct MoveIntent
{
    bool left = false;
    bool right = false;

    [[nodiscard]] int Direction() const { return (right ? 1 : 0) - (left ? 1 : 0); }
};

/// Fixed-step platformer integration against a room's season-dependent geometry.
class ActorPhysics
{
public:
    explicit ActorPhysics(const GameplayTuning& tuning);

    /// One frame of movement:
    ///  1. horizontal speed from input
    ///  2. water drag (Spring/Summer) and wind push per zone (Autumn)
    ///  3. gravity, clamped to the terminal fall speed
    ///  4. horizontal move and push-out, then vertical move and snap
    ///  5. ice slip on frozen water (Winter), then the world-band clamp
    /// Jumping is not part of the step; see TryJump.
    void Step(
        Actor& actor,
        const MoveIntent& intent,
        const world::RoomGeometry& room,
        world::Season season,
        const Modifiers& modifiers
    ) const;

    /// Edge-triggered jump. Only applies while grounded; returns whether it did.
    bool TryJump(Actor& actor, const Modifiers& modifiers) const;

    [[nodiscard]] engine::physics::Rect SpawnBox() const { return m_tuning.SpawnBox(); }
    [[nodiscard]] const GameplayTuning& Tuning() const { return m_tuning; }

private:
    GameplayTuning m_tuning;
};
} // namespace game::gameplay
