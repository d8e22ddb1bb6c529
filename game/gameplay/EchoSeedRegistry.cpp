#include "game/gameplay/EchoSeedRegistry.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace game::gameplay::seeds
{
EchoSeedRegistry::EchoSeedRegistry()
{
    InitializeDefaultSeeds();
}

void EchoSeedRegistry::InitializeDefaultSeeds()
{
    Clear();

    EchoSeed swiftstride;
    swiftstride.id = "swiftstride";
    swiftstride.name = "Swiftstride";
    swiftstride.description = "+20% movement speed.";
    swiftstride.effect.speedFactor = 1.2F;
    RegisterSeed(swiftstride);

    EchoSeed moonlightBones;
    moonlightBones.id = "moonlight_bones";
    moonlightBones.name = "Moonlight Bones";
    moonlightBones.description = "Lower gravity, slightly higher jump.";
    moonlightBones.effect.gravityFactor = 0.82F;
    moonlightBones.effect.jumpFactor = 1.08F;
    RegisterSeed(moonlightBones);

    EchoSeed brittleThorns;
    brittleThorns.id = "brittle_thorns";
    brittleThorns.name = "Brittle Thorns";
    brittleThorns.description = "Spring thorns are now dangerous.";
    brittleThorns.effect.brittleThorns = true;
    RegisterSeed(brittleThorns);

    EchoSeed glacialRhythm;
    glacialRhythm.id = "glacial_rhythm";
    glacialRhythm.name = "Glacial Rhythm";
    glacialRhythm.description = "Season cycle cooldown increased.";
    glacialRhythm.effect.slowCycle = true;
    RegisterSeed(glacialRhythm);

    EchoSeed heavyBloom;
    heavyBloom.id = "heavy_bloom";
    heavyBloom.name = "Heavy Bloom";
    heavyBloom.description = "Spring/Summer water slows you more.";
    heavyBloom.effect.waterDragFactor = 0.75F;
    RegisterSeed(heavyBloom);

    EchoSeed tailwind;
    tailwind.id = "tailwind";
    tailwind.name = "Tailwind";
    tailwind.description = "Autumn wind pushes harder.";
    tailwind.effect.windPushOverride = 0.45F;
    RegisterSeed(tailwind);
}

void EchoSeedRegistry::Clear()
{
    m_registry.clear();
    m_order.clear();
}

void EchoSeedRegistry::RegisterSeed(const EchoSeed& seed)
{
    if (m_registry.contains(seed.id))
    {
        std::cout << "EchoSeedRegistry: WARNING - Seed with id '" << seed.id << "' already registered, overwriting\n";
    }
    else
    {
        m_order.push_back(seed.id);
    }
    m_registry[seed.id] = seed;
}

const EchoSeed* EchoSeedRegistry::GetSeed(const std::string& id) const
{
    const auto it = m_registry.find(id);
    if (it != m_registry.end())
    {
        return &it->second;
    }
    return nullptr;
}

bool EchoSeedRegistry::HasSeed(const std::string& id) const
{
    return m_registry.contains(id);
}

std::vector<std::string> EchoSeedRegistry::ListSeeds() const
{
    return m_order;
}

std::vector<std::string> EchoSeedRegistry::SelectSeeds(std::size_t count, std::mt19937& rng) const
{
    if (count > m_order.size())
    {
        throw std::invalid_argument(
            "cannot select " + std::to_string(count) + " echo seeds from a pool of " + std::to_string(m_order.size())
        );
    }

    std::vector<std::string> selected;
    selected.reserve(count);
    std::sample(m_order.begin(), m_order.end(), std::back_inserter(selected), count, rng);
    std::shuffle(selected.begin(), selected.end(), rng);
    return selected;
}

Modifiers EchoSeedRegistry::ResolveModifiers(const std::vector<std::string>& seedIds) const
{
    std::unordered_set<std::string> seen;
    ModifiersBuilder builder;
    for (const std::string& id : seedIds)
    {
        if (!seen.insert(id).second)
        {
            throw std::invalid_argument("echo seed '" + id + "' selected more than once");
        }

        const EchoSeed* seed = GetSeed(id);
        if (seed == nullptr)
        {
            throw std::invalid_argument("unknown echo seed '" + id + "'");
        }
        builder.Apply(seed->effect);
    }
    return builder.Build();
}

bool EchoSeedRegistry::LoadSeedsFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "EchoSeedRegistry: WARNING - Could not open echo seeds file at '" << jsonPath << "'\n";
        return false;
    }

    std::vector<EchoSeed> loaded;
    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "EchoSeedRegistry: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("echo_seeds"))
        {
            std::cout << "EchoSeedRegistry: WARNING - No 'echo_seeds' array found in JSON\n";
            return false;
        }

        for (const auto& seedJson : root["echo_seeds"])
        {
            EchoSeed seed;
            seed.id = seedJson.value("id", "");
            seed.name = seedJson.value("name", seed.id);
            seed.description = seedJson.value("description", "");

            if (seedJson.contains("effects"))
            {
                const auto& effectsJson = seedJson["effects"];
                auto& e = seed.effect;
                e.speedFactor = effectsJson.value("speed_mult", 1.0F);
                e.gravityFactor = effectsJson.value("gravity_mult", 1.0F);
                e.jumpFactor = effectsJson.value("jump_mult", 1.0F);
                e.waterDragFactor = effectsJson.value("water_drag_mult", 1.0F);
                e.iceSlipFactor = effectsJson.value("ice_slip_mult", 1.0F);
                if (effectsJson.contains("wind_push"))
                {
                    e.windPushOverride = effectsJson["wind_push"].get<float>();
                }
                e.brittleThorns = effectsJson.value("brittle_thorns", false);
                e.slowCycle = effectsJson.value("slow_cycle", false);
            }

            if (!seed.id.empty())
            {
                loaded.push_back(seed);
            }
        }
    }
    catch (const std::exception& e)
    {
        std::cout << "EchoSeedRegistry: ERROR - Failed to load echo seeds: " << e.what() << "\n";
        return false;
    }

    if (loaded.empty())
    {
        std::cout << "EchoSeedRegistry: WARNING - '" << jsonPath << "' defines no echo seeds, keeping current pool\n";
        return false;
    }

    Clear();
    for (const EchoSeed& seed : loaded)
    {
        RegisterSeed(seed);
    }
    std::cout << "EchoSeedRegistry: Loaded " << m_order.size() << " echo seeds from " << jsonPath << "\n";
    return true;
}

bool EchoSeedRegistry::SaveSeedsToJson(const std::string& jsonPath) const
{
    try
    {
        nlohmann::json root;
        root["asset_version"] = 1;

        nlohmann::json seedsArray = nlohmann::json::array();
        for (const std::string& id : m_order)
        {
            const EchoSeed& seed = m_registry.at(id);
            nlohmann::json seedJson;
            seedJson["id"] = seed.id;
            seedJson["name"] = seed.name;
            seedJson["description"] = seed.description;

            nlohmann::json effectsJson;
            const auto& e = seed.effect;
            effectsJson["speed_mult"] = e.speedFactor;
            effectsJson["gravity_mult"] = e.gravityFactor;
            effectsJson["jump_mult"] = e.jumpFactor;
            effectsJson["water_drag_mult"] = e.waterDragFactor;
            effectsJson["ice_slip_mult"] = e.iceSlipFactor;
            if (e.windPushOverride.has_value())
            {
                effectsJson["wind_push"] = *e.windPushOverride;
            }
            effectsJson["brittle_thorns"] = e.brittleThorns;
            effectsJson["slow_cycle"] = e.slowCycle;

            seedJson["effects"] = effectsJson;
            seedsArray.push_back(seedJson);
        }
        root["echo_seeds"] = seedsArray;

        std::ofstream file(jsonPath);
        if (!file.is_open())
        {
            std::cout << "EchoSeedRegistry: ERROR - Could not open '" << jsonPath << "' for writing\n";
            return false;
        }

        file << root.dump(2);
        std::cout << "EchoSeedRegistry: Saved " << m_order.size() << " echo seeds to " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "EchoSeedRegistry: ERROR - Failed to save echo seeds: " << e.what() << "\n";
        return false;
    }
}
} // namespace game::gameplay::seeds
