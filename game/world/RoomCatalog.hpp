#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "game/world/RoomGeometry.hpp"

namespace game::world
{
/// The set of room templates a run's room sequence is drawn from.
class RoomCatalog
{
public:
    RoomCatalog();

    void InitializeDefaultRooms();
    void Clear() { m_templates.clear(); }

    /// Throws std::invalid_argument when the template has no exit.
    void AddTemplate(const RoomTemplate& layout);

    [[nodiscard]] const std::vector<RoomTemplate>& Templates() const { return m_templates; }
    [[nodiscard]] std::size_t Size() const { return m_templates.size(); }
    [[nodiscard]] bool Empty() const { return m_templates.empty(); }

    /// Picks count templates with replacement. Throws when the catalog is empty.
    [[nodiscard]] std::vector<RoomGeometry> SampleRooms(std::size_t count, std::mt19937& rng) const;

    /// Replaces the catalog with the file contents. On failure the catalog is left unchanged.
    bool LoadFromJson(const std::string& jsonPath);
    bool SaveToJson(const std::string& jsonPath) const;

private:
    std::vector<RoomTemplate> m_templates;
};
} // namespace game::world
