#include "engine/physics/PhysicsWorld.hpp"

#include <algorithm>
#include <cmath>

namespace engine::physics
{
void PhysicsWorld::Clear()
{
    m_solids.clear();
    m_triggers.clear();
}

void PhysicsWorld::AddSolidBox(const Rect& box)
{
    m_solids.push_back(box);
}

void PhysicsWorld::AddTrigger(const TriggerVolume& trigger)
{
    m_triggers.push_back(trigger);
}

int PhysicsWorld::RoundToPixels(float value)
{
    // nearbyint honours the current rounding mode; the default is round-half-to-even.
    return static_cast<int>(std::nearbyint(value));
}

MoveResult PhysicsWorld::MoveBox(const Rect& box, const glm::vec2& velocity) const
{
    MoveResult result;
    result.box = box;
    result.velocity = velocity;

    MoveHorizontal(result);
    MoveVertical(result);
    return result;
}

void PhysicsWorld::MoveHorizontal(MoveResult& state) const
{
    state.box.x += RoundToPixels(state.velocity.x);

    for (const Rect& solid : m_solids)
    {
        if (!state.box.Overlaps(solid))
        {
            continue;
        }

        if (state.velocity.x > 0.0F)
        {
            state.box.SetRight(solid.Left());
            state.collidedHorizontal = true;
        }
        else if (state.velocity.x < 0.0F)
        {
            state.box.SetLeft(solid.Right());
            state.collidedHorizontal = true;
        }
    }
}

void PhysicsWorld::MoveVertical(MoveResult& state) const
{
    state.box.y += RoundToPixels(state.velocity.y);
    state.grounded = false;

    for (const Rect& solid : m_solids)
    {
        if (!state.box.Overlaps(solid))
        {
            continue;
        }

        if (state.velocity.y > 0.0F)
        {
            state.box.SetBottom(solid.Top());
            state.velocity.y = 0.0F;
            state.grounded = true;
            state.collidedVertical = true;
        }
        else if (state.velocity.y < 0.0F)
        {
            state.box.SetTop(solid.Bottom());
            state.velocity.y = 0.0F;
            state.collidedVertical = true;
        }
    }
}

bool PhysicsWorld::OverlapsSolid(const Rect& box) const
{
    return std::any_of(m_solids.begin(), m_solids.end(), [&box](const Rect& solid) { return box.Overlaps(solid); });
}

std::size_t PhysicsWorld::CountTriggers(const Rect& box, TriggerKind kind) const
{
    return static_cast<std::size_t>(std::count_if(m_triggers.begin(), m_triggers.end(), [&](const TriggerVolume& trigger) {
        return trigger.kind == kind && box.Overlaps(trigger.bounds);
    }));
}
} // namespace engine::physics
