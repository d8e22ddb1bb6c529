#include "game/gameplay/ActorPhysics.hpp"

#include <algorithm>

#include "engine/physics/PhysicsWorld.hpp"

namespace game::gameplay
{
using engine::physics::PhysicsWorld;
using engine::physics::TriggerKind;
using world::Season;

ActorPhysics::ActorPhysics(const GameplayTuning& tuning)
    : m_tuning(tuning)
{
}

void ActorPhysics::Step(
    Actor& actor,
    const MoveIntent& intent,
    const world::RoomGeometry& room,
    Season season,
    const Modifiers& modifiers
) const
{
    PhysicsWorld physics;
    room.BuildPhysicsWorld(season, physics);

    // Water contact is sampled before moving and reused for the post-move ice slip.
    const bool inWater = physics.OverlapsTrigger(actor.box, TriggerKind::Water);

    float velocityX = static_cast<float>(intent.Direction()) * m_tuning.baseSpeed * modifiers.speedMultiplier;

    if (inWater && (season == Season::Spring || season == Season::Summer))
    {
        velocityX *= m_tuning.waterDragFactor * modifiers.waterDragMultiplier;
    }

    if (season == Season::Autumn)
    {
        const auto zones = physics.CountTriggers(actor.box, TriggerKind::Wind);
        velocityX += modifiers.windPush * static_cast<float>(zones);
    }

    const float gravity = m_tuning.baseGravity * modifiers.gravityMultiplier;
    const float velocityY = std::min(actor.velocity.y + gravity, m_tuning.maxFallSpeed);

    const engine::physics::MoveResult moved = physics.MoveBox(actor.box, {velocityX, velocityY});
    actor.box = moved.box;
    actor.velocity = moved.velocity;
    actor.grounded = moved.grounded;

    if (inWater && season == Season::Winter)
    {
        actor.velocity.x *= m_tuning.iceSlipFactor * modifiers.iceSlip;
    }

    actor.box.ClampInside(m_tuning.WorldBounds());
}

bool ActorPhysics::TryJump(Actor& actor, const Modifiers& modifiers) const
{
    if (!actor.grounded)
    {
        return false;
    }

    actor.velocity.y = -m_tuning.baseJump * modifiers.jumpMultiplier;
    actor.grounded = false;
    return true;
}
} // namespace game::gameplay
