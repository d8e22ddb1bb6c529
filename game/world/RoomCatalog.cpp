#include "game/world/RoomCatalog.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace game::world
{
namespace
{
using json = nlohmann::json;

constexpr int kWorldWidth = 960;
constexpr int kGroundY = 540 - 42;

Rect RectFromJson(const json& value)
{
    if (!value.is_array() || value.size() != 4)
    {
        throw std::invalid_argument("rectangle must be an array of 4 integers");
    }
    return Rect{value[0].get<int>(), value[1].get<int>(), value[2].get<int>(), value[3].get<int>()};
}

json RectToJson(const Rect& rect)
{
    return json::array({rect.x, rect.y, rect.w, rect.h});
}

std::vector<Rect> RectListFromJson(const json& root, const char* key)
{
    std::vector<Rect> rects;
    if (!root.contains(key))
    {
        return rects;
    }
    for (const json& entry : root[key])
    {
        rects.push_back(RectFromJson(entry));
    }
    return rects;
}

json RectListToJson(const std::vector<Rect>& rects)
{
    json list = json::array();
    for (const Rect& rect : rects)
    {
        list.push_back(RectToJson(rect));
    }
    return list;
}

SeasonalPlatform Seasonal(Rect bounds, SeasonMask seasons, PlatformKind kind)
{
    SeasonalPlatform platform;
    platform.bounds = bounds;
    platform.seasons = seasons;
    platform.kind = kind;
    return platform;
}
} // namespace

RoomCatalog::RoomCatalog()
{
    InitializeDefaultRooms();
}

void RoomCatalog::InitializeDefaultRooms()
{
    m_templates.clear();
    const Rect ground{0, kGroundY, kWorldWidth, 50};
    const SeasonMask springAutumn = SeasonMask::Of({Season::Spring, Season::Autumn});
    const SeasonMask winter = SeasonMask::Of({Season::Winter});

    // Thorn pit between the first ledges; the exit sits at ground level on the right.
    RoomTemplate meadow;
    meadow.id = "meadow_crossing";
    meadow.platforms = {ground, {190, 430, 170, 20}, {450, 360, 180, 20}};
    meadow.seasonalPlatforms = {
        Seasonal({330, 300, 130, 16}, springAutumn, PlatformKind::Vine),
        Seasonal({690, 270, 170, 16}, winter, PlatformKind::Ice),
    };
    meadow.hazards = {{560, kGroundY - 18, 130, 18}};
    meadow.water = {{95, kGroundY - 18, 180, 18}};
    meadow.wind = {{640, 210, 200, 220}};
    meadow.exit = {900, kGroundY - 70, 44, 70};
    AddTemplate(meadow);

    // Raised exit reached by climbing the staircase and the spring/autumn vine.
    RoomTemplate canopy;
    canopy.id = "canopy_climb";
    canopy.platforms = {ground, {160, 390, 120, 20}, {350, 330, 140, 20}, {560, 285, 120, 20}};
    canopy.seasonalPlatforms = {
        Seasonal({285, 445, 110, 16}, winter, PlatformKind::Ice),
        Seasonal({725, 250, 145, 16}, springAutumn, PlatformKind::Vine),
    };
    canopy.hazards = {{380, kGroundY - 18, 120, 18}};
    canopy.water = {{640, kGroundY - 20, 210, 20}};
    canopy.wind = {{95, 220, 180, 230}};
    canopy.exit = {902, 180, 40, 68};
    AddTemplate(canopy);

    // Exit on the far left; thorns guard both ends of the floor.
    RoomTemplate hollow;
    hollow.id = "frozen_hollow";
    hollow.platforms = {ground, {105, 455, 160, 20}, {360, 415, 160, 20}, {620, 360, 150, 20}};
    hollow.seasonalPlatforms = {
        Seasonal({500, 300, 130, 16}, springAutumn, PlatformKind::Vine),
        Seasonal({260, 310, 130, 16}, winter, PlatformKind::Ice),
    };
    hollow.hazards = {{140, kGroundY - 16, 135, 16}, {810, kGroundY - 16, 90, 16}};
    hollow.water = {{430, kGroundY - 18, 200, 18}};
    hollow.wind = {{700, 210, 160, 210}};
    hollow.exit = {34, 380, 38, 70};
    AddTemplate(hollow);
}

void RoomCatalog::AddTemplate(const RoomTemplate& layout)
{
    if (layout.exit.IsEmpty())
    {
        throw std::invalid_argument("room template '" + layout.id + "' has no exit rectangle");
    }
    m_templates.push_back(layout);
}

std::vector<RoomGeometry> RoomCatalog::SampleRooms(std::size_t count, std::mt19937& rng) const
{
    if (m_templates.empty())
    {
        throw std::invalid_argument("cannot sample rooms from an empty catalog");
    }

    std::uniform_int_distribution<std::size_t> pick(0, m_templates.size() - 1);
    std::vector<RoomGeometry> rooms;
    rooms.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        rooms.emplace_back(m_templates[pick(rng)]);
    }
    return rooms;
}

bool RoomCatalog::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "RoomCatalog: WARNING - Could not open rooms file at '" << jsonPath << "'\n";
        return false;
    }

    std::vector<RoomTemplate> loaded;
    try
    {
        json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "RoomCatalog: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("rooms") || !root["rooms"].is_array())
        {
            std::cout << "RoomCatalog: WARNING - No 'rooms' array found in JSON\n";
            return false;
        }

        for (const json& roomJson : root["rooms"])
        {
            RoomTemplate layout;
            layout.id = roomJson.value("id", "room_" + std::to_string(loaded.size()));
            layout.platforms = RectListFromJson(roomJson, "platforms");
            layout.hazards = RectListFromJson(roomJson, "hazards");
            layout.water = RectListFromJson(roomJson, "water");
            layout.wind = RectListFromJson(roomJson, "wind");
            if (!roomJson.contains("exit"))
            {
                throw std::invalid_argument("room '" + layout.id + "' is missing 'exit'");
            }
            layout.exit = RectFromJson(roomJson["exit"]);

            if (roomJson.contains("seasonal_platforms"))
            {
                for (const json& seasonalJson : roomJson["seasonal_platforms"])
                {
                    SeasonalPlatform platform;
                    platform.bounds = RectFromJson(seasonalJson.at("rect"));
                    for (const json& seasonJson : seasonalJson.value("seasons", json::array()))
                    {
                        const auto season = ParseSeason(seasonJson.get<std::string>());
                        if (!season.has_value())
                        {
                            throw std::invalid_argument("unknown season '" + seasonJson.get<std::string>() + "'");
                        }
                        platform.seasons.Add(*season);
                    }
                    platform.kind = seasonalJson.value("kind", "vine") == "ice" ? PlatformKind::Ice : PlatformKind::Vine;
                    layout.seasonalPlatforms.push_back(platform);
                }
            }

            if (layout.exit.IsEmpty())
            {
                throw std::invalid_argument("room '" + layout.id + "' has an empty exit rectangle");
            }
            loaded.push_back(std::move(layout));
        }
    }
    catch (const std::exception& e)
    {
        std::cout << "RoomCatalog: ERROR - Failed to load rooms from '" << jsonPath << "': " << e.what() << "\n";
        return false;
    }

    if (loaded.empty())
    {
        std::cout << "RoomCatalog: WARNING - '" << jsonPath << "' defines no rooms, keeping current catalog\n";
        return false;
    }

    m_templates = std::move(loaded);
    std::cout << "RoomCatalog: Loaded " << m_templates.size() << " rooms from " << jsonPath << "\n";
    return true;
}

bool RoomCatalog::SaveToJson(const std::string& jsonPath) const
{
    try
    {
        json root;
        root["asset_version"] = 1;

        json rooms = json::array();
        for (const RoomTemplate& layout : m_templates)
        {
            json roomJson;
            roomJson["id"] = layout.id;
            roomJson["platforms"] = RectListToJson(layout.platforms);
            roomJson["hazards"] = RectListToJson(layout.hazards);
            roomJson["water"] = RectListToJson(layout.water);
            roomJson["wind"] = RectListToJson(layout.wind);
            roomJson["exit"] = RectToJson(layout.exit);

            json seasonal = json::array();
            for (const SeasonalPlatform& platform : layout.seasonalPlatforms)
            {
                json seasons = json::array();
                for (const Season season : kSeasonOrder)
                {
                    if (platform.seasons.Contains(season))
                    {
                        seasons.push_back(SeasonToId(season));
                    }
                }
                seasonal.push_back({
                    {"rect", RectToJson(platform.bounds)},
                    {"seasons", seasons},
                    {"kind", PlatformKindToText(platform.kind)},
                });
            }
            roomJson["seasonal_platforms"] = seasonal;
            rooms.push_back(roomJson);
        }
        root["rooms"] = rooms;

        std::ofstream file(jsonPath);
        if (!file.is_open())
        {
            std::cout << "RoomCatalog: ERROR - Could not open '" << jsonPath << "' for writing\n";
            return false;
        }

        file << root.dump(2);
        std::cout << "RoomCatalog: Saved " << m_templates.size() << " rooms to " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "RoomCatalog: ERROR - Failed to save rooms: " << e.what() << "\n";
        return false;
    }
}
} // namespace game::world
