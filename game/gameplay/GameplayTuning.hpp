#pragma once

#include <cstdint>
#include <string>

#include "engine/physics/Rect.hpp"

namespace game::gameplay
{
/// Every constant the simulation reads. Defaults reproduce the shipped feel.
struct GameplayTuning
{
    int assetVersion = 1;

    // Actor movement
    float baseSpeed = 4.8F;
    float baseJump = 12.5F;
    float baseGravity = 0.58F;
    float maxFallSpeed = 15.0F;
    float waterDragFactor = 0.45F;
    float iceSlipFactor = 0.985F;

    // Actor body and spawn
    int actorWidth = 34;
    int actorHeight = 52;
    int spawnX = 70;
    int spawnY = 420;

    // World extents (screen space, y down)
    int worldWidth = 960;
    int worldHeight = 540;
    int boundsTop = -200;
    int boundsBottom = 740;
    int fallMarginBelow = 80;

    // Run structure
    int roomsPerRun = 5;
    int echoSeedsPerRun = 2;
    std::int64_t seasonCooldownMs = 500;
    std::int64_t slowSeasonCooldownMs = 800;
    int fixedTickHz = 60;

    [[nodiscard]] engine::physics::Rect WorldBounds() const
    {
        return {0, boundsTop, worldWidth, boundsBottom - boundsTop};
    }

    [[nodiscard]] engine::physics::Rect SpawnBox() const
    {
        return {spawnX, spawnY, actorWidth, actorHeight};
    }

    /// An actor whose top edge is below this line has fallen out of the world.
    [[nodiscard]] int FallLineY() const { return worldHeight + fallMarginBelow; }

    /// Checks that the values describe a playable world: a positive actor
    /// and world, non-negative cooldowns, and a world band deep enough that
    /// a falling actor can pass the fall line. Writes the first problem to outError.
    [[nodiscard]] bool Validate(std::string* outError = nullptr) const;
};

/// Reads tuning from path. Missing keys keep their defaults. Returns false when
/// the file cannot be opened or parsed, or the result fails Validate; tuning is
/// then left untouched.
bool LoadGameplayTuning(const std::string& path, GameplayTuning& tuning);
bool SaveGameplayTuning(const std::string& path, const GameplayTuning& tuning);
} // namespace game::gameplay
