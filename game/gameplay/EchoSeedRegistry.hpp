#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "game/gameplay/Modifiers.hpp"

namespace game::gameplay::seeds
{
struct EchoSeed
{
    std::string id;
    std::string name;
    std::string description;
    EchoSeedEffect effect;
};

/// Pool of echo seeds a run draws its upgrades from.
class EchoSeedRegistry
{
public:
    EchoSeedRegistry();

    void InitializeDefaultSeeds();
    void Clear();

    [[nodiscard]] const EchoSeed* GetSeed(const std::string& id) const;
    [[nodiscard]] bool HasSeed(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> ListSeeds() const;
    [[nodiscard]] std::size_t Size() const { return m_order.size(); }

    /// Draws count distinct seed ids. Throws std::invalid_argument if count exceeds the pool.
    [[nodiscard]] std::vector<std::string> SelectSeeds(std::size_t count, std::mt19937& rng) const;

    /// Folds the listed seeds over identity modifiers. Unknown or repeated ids throw std::invalid_argument.
    [[nodiscard]] Modifiers ResolveModifiers(const std::vector<std::string>& seedIds) const;

    bool LoadSeedsFromJson(const std::string& jsonPath);
    bool SaveSeedsToJson(const std::string& jsonPath) const;

private:
    void RegisterSeed(const EchoSeed& seed);

    std::unordered_map<std::string, EchoSeed> m_registry;
    std::vector<std::string> m_order;
};
} // namespace game::gameplay::seeds
