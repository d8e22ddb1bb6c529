#pragma once

#include <string>
#include <vector>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/physics/Rect.hpp"
#include "game/world/Season.hpp"

namespace game::world
{
using engine::physics::Rect;

enum class PlatformKind
{
    Vine,
    Ice
};

/// A platform that is solid only while the active season is in its mask.
struct SeasonalPlatform
{
    Rect bounds;
    SeasonMask seasons;
    PlatformKind kind = PlatformKind::Vine;
};

/// Plain-data description of a room, as authored in catalogs and JSON.
struct RoomTemplate
{
    std::string id;
    std::vector<Rect> platforms;
    std::vector<SeasonalPlatform> seasonalPlatforms;
    std::vector<Rect> hazards;
    std::vector<Rect> water;
    std::vector<Rect> wind;
    Rect exit;
};

/// Immutable collision geometry for one room of a run.
class RoomGeometry
{
public:
    /// Throws std::invalid_argument when the exit rectangle has no area.
    explicit RoomGeometry(RoomTemplate layout);

    [[nodiscard]] const std::string& Id() const { return m_layout.id; }
    [[nodiscard]] const std::vector<Rect>& BasePlatforms() const { return m_layout.platforms; }
    [[nodiscard]] const std::vector<SeasonalPlatform>& SeasonalPlatforms() const { return m_layout.seasonalPlatforms; }
    [[nodiscard]] const std::vector<Rect>& Hazards() const { return m_layout.hazards; }
    [[nodiscard]] const std::vector<Rect>& Water() const { return m_layout.water; }
    [[nodiscard]] const std::vector<Rect>& Wind() const { return m_layout.wind; }
    [[nodiscard]] const Rect& Exit() const { return m_layout.exit; }
    [[nodiscard]] const RoomTemplate& Layout() const { return m_layout; }

    /// Base platforms, seasonal platforms tagged with season, and water when frozen (Winter).
    [[nodiscard]] std::vector<Rect> ActivePlatforms(Season season) const;

    /// Summer and Autumn always; Spring only with brittle thorns; never in Winter.
    [[nodiscard]] static bool HazardActive(Season season, bool brittleThorns);

    /// Fills world with this room's solids for season plus water, wind, hazard and exit triggers.
    void BuildPhysicsWorld(Season season, engine::physics::PhysicsWorld& world) const;

private:
    RoomTemplate m_layout;
};

[[nodiscard]] const char* PlatformKindToText(PlatformKind kind);
} // namespace game::world
