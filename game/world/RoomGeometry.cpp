#include "game/world/RoomGeometry.hpp"

#include <stdexcept>
#include <utility>

namespace game::world
{
RoomGeometry::RoomGeometry(RoomTemplate layout)
    : m_layout(std::move(layout))
{
    if (m_layout.exit.IsEmpty())
    {
        throw std::invalid_argument("room '" + m_layout.id + "' has no exit rectangle");
    }
}

std::vector<Rect> RoomGeometry::ActivePlatforms(Season season) const
{
    std::vector<Rect> active = m_layout.platforms;
    for (const SeasonalPlatform& platform : m_layout.seasonalPlatforms)
    {
        if (platform.seasons.Contains(season))
        {
            active.push_back(platform.bounds);
        }
    }
    if (season == Season::Winter)
    {
        active.insert(active.end(), m_layout.water.begin(), m_layout.water.end());
    }
    return active;
}

bool RoomGeometry::HazardActive(Season season, bool brittleThorns)
{
    switch (season)
    {
        case Season::Summer:
        case Season::Autumn:
            return true;
        case Season::Spring:
            return brittleThorns;
        case Season::Winter:
        default:
            return false;
    }
}

void RoomGeometry::BuildPhysicsWorld(Season season, engine::physics::PhysicsWorld& world) const
{
    using engine::physics::TriggerKind;

    world.Clear();
    for (const Rect& solid : ActivePlatforms(season))
    {
        world.AddSolidBox(solid);
    }
    for (const Rect& water : m_layout.water)
    {
        world.AddTrigger({water, TriggerKind::Water});
    }
    for (const Rect& zone : m_layout.wind)
    {
        world.AddTrigger({zone, TriggerKind::Wind});
    }
    for (const Rect& hazard : m_layout.hazards)
    {
        world.AddTrigger({hazard, TriggerKind::Hazard});
    }
    world.AddTrigger({m_layout.exit, TriggerKind::Exit});
}

const char* PlatformKindToText(PlatformKind kind)
{
    switch (kind)
    {
        case PlatformKind::Vine: return "vine";
        case PlatformKind::Ice: return "ice";
        default: return "unknown";
    }
}
} // namespace game::world
