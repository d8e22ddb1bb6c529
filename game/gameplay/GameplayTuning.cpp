#include "game/gameplay/GameplayTuning.hpp"

#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace game::gameplay
{
namespace
{
using json = nlohmann::json;

bool Reject(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
    return false;
}
} // namespace

bool GameplayTuning::Validate(std::string* outError) const
{
    if (actorWidth <= 0 || actorHeight <= 0)
    {
        return Reject(outError, "actor_width and actor_height must be positive");
    }
    if (worldWidth < actorWidth || worldHeight <= 0)
    {
        return Reject(outError, "world_width must fit the actor and world_height must be positive");
    }
    if (boundsBottom - boundsTop < actorHeight)
    {
        return Reject(outError, "bounds_top..bounds_bottom must be at least actor_height tall");
    }
    // The clamp stops the actor's top at boundsBottom - actorHeight; it has to pass the fall line.
    if (boundsBottom - actorHeight <= FallLineY())
    {
        return Reject(
            outError,
            "bounds_bottom (" + std::to_string(boundsBottom) + ") must exceed the fall line plus actor_height ("
                + std::to_string(FallLineY() + actorHeight) + ")"
        );
    }
    if (maxFallSpeed <= 0.0F || baseGravity <= 0.0F)
    {
        return Reject(outError, "base_gravity and max_fall_speed must be positive");
    }
    if (seasonCooldownMs < 0 || slowSeasonCooldownMs < 0)
    {
        return Reject(outError, "season cooldowns must not be negative");
    }
    if (fixedTickHz <= 0)
    {
        return Reject(outError, "fixed_tick_hz must be positive");
    }
    return true;
}

bool LoadGameplayTuning(const std::string& path, GameplayTuning& tuning)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cout << "GameplayTuning: WARNING - Could not open '" << path << "', using defaults\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& e)
    {
        std::cout << "GameplayTuning: ERROR - Invalid tuning JSON in '" << path << "': " << e.what() << "\n";
        return false;
    }

    GameplayTuning loaded = tuning;
    auto readFloat = [&](const char* key, float& target) {
        if (root.contains(key) && root[key].is_number())
        {
            target = root[key].get<float>();
        }
    };
    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };
    auto readMs = [&](const char* key, std::int64_t& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<std::int64_t>();
        }
    };

    readInt("asset_version", loaded.assetVersion);
    readFloat("base_speed", loaded.baseSpeed);
    readFloat("base_jump", loaded.baseJump);
    readFloat("base_gravity", loaded.baseGravity);
    readFloat("max_fall_speed", loaded.maxFallSpeed);
    readFloat("water_drag_factor", loaded.waterDragFactor);
    readFloat("ice_slip_factor", loaded.iceSlipFactor);
    readInt("actor_width", loaded.actorWidth);
    readInt("actor_height", loaded.actorHeight);
    readInt("spawn_x", loaded.spawnX);
    readInt("spawn_y", loaded.spawnY);
    readInt("world_width", loaded.worldWidth);
    readInt("world_height", loaded.worldHeight);
    readInt("bounds_top", loaded.boundsTop);
    readInt("bounds_bottom", loaded.boundsBottom);
    readInt("fall_margin_below", loaded.fallMarginBelow);
    readInt("rooms_per_run", loaded.roomsPerRun);
    readInt("echo_seeds_per_run", loaded.echoSeedsPerRun);
    readMs("season_cooldown_ms", loaded.seasonCooldownMs);
    readMs("slow_season_cooldown_ms", loaded.slowSeasonCooldownMs);
    readInt("fixed_tick_hz", loaded.fixedTickHz);

    if (loaded.assetVersion != 1)
    {
        std::cout << "GameplayTuning: WARNING - Unexpected asset version " << loaded.assetVersion << ", expected 1\n";
    }

    std::string error;
    if (!loaded.Validate(&error))
    {
        std::cout << "GameplayTuning: ERROR - Rejected '" << path << "': " << error << "\n";
        return false;
    }

    tuning = loaded;
    return true;
}

bool SaveGameplayTuning(const std::string& path, const GameplayTuning& tuning)
{
    json root;
    root["asset_version"] = tuning.assetVersion;
    root["base_speed"] = tuning.baseSpeed;
    root["base_jump"] = tuning.baseJump;
    root["base_gravity"] = tuning.baseGravity;
    root["max_fall_speed"] = tuning.maxFallSpeed;
    root["water_drag_factor"] = tuning.waterDragFactor;
    root["ice_slip_factor"] = tuning.iceSlipFactor;
    root["actor_width"] = tuning.actorWidth;
    root["actor_height"] = tuning.actorHeight;
    root["spawn_x"] = tuning.spawnX;
    root["spawn_y"] = tuning.spawnY;
    root["world_width"] = tuning.worldWidth;
    root["world_height"] = tuning.worldHeight;
    root["bounds_top"] = tuning.boundsTop;
    root["bounds_bottom"] = tuning.boundsBottom;
    root["fall_margin_below"] = tuning.fallMarginBelow;
    root["rooms_per_run"] = tuning.roomsPerRun;
    root["echo_seeds_per_run"] = tuning.echoSeedsPerRun;
    root["season_cooldown_ms"] = tuning.seasonCooldownMs;
    root["slow_season_cooldown_ms"] = tuning.slowSeasonCooldownMs;
    root["fixed_tick_hz"] = tuning.fixedTickHz;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        std::cout << "GameplayTuning: ERROR - Could not open '" << path << "' for writing\n";
        return false;
    }

    stream << root.dump(2);
    return true;
}
} // namespace game::gameplay
