#include "game/world/Season.hpp"

#include <algorithm>
#include <cctype>

namespace game::world
{
const char* SeasonToText(Season season)
{
    switch (season)
    {
        case Season::Spring: return "Spring";
        case Season::Summer: return "Summer";
        case Season::Autumn: return "Autumn";
        case Season::Winter: return "Winter";
        default: return "Unknown";
    }
}

const char* SeasonToId(Season season)
{
    switch (season)
    {
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
        case Season::Winter: return "winter";
        default: return "unknown";
    }
}

std::optional<Season> ParseSeason(const std::string& text)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (const Season season : kSeasonOrder)
    {
        if (lowered == SeasonToId(season))
        {
            return season;
        }
    }
    return std::nullopt;
}
} // namespace game::world
