#include "game/ui/RoomView.hpp"

#include <algorithm>

#include <glm/common.hpp>

namespace game::ui
{
namespace
{
using engine::physics::Rect;
using world::Season;

glm::vec3 Rgb(int r, int g, int b)
{
    return glm::vec3{static_cast<float>(r), static_cast<float>(g), static_cast<float>(b)} / 255.0F;
}

const glm::vec3 kPlatformColor = Rgb(80, 68, 50);
const glm::vec3 kHazardActiveColor = Rgb(192, 58, 46);
const glm::vec3 kHazardDormantColor = Rgb(116, 112, 118);
const glm::vec3 kHazardTipColor = Rgb(240, 196, 177);
const glm::vec3 kExitColor = Rgb(240, 246, 154);
const glm::vec3 kExitEdgeColor = Rgb(50, 60, 64);
const glm::vec3 kActorColor = Rgb(220, 220, 235);
const glm::vec3 kActorEdgeColor = Rgb(40, 40, 55);
const glm::vec3 kHudPanelColor = Rgb(20, 20, 26);
const glm::vec3 kCooldownColor = Rgb(210, 210, 220);
const glm::vec3 kWonColor = Rgb(160, 245, 176);
const glm::vec3 kFailedColor = Rgb(245, 126, 126);

constexpr int kTipSpacing = 14;
constexpr int kTipWidth = 4;
constexpr int kCooldownBarWidth = 200;

glm::vec3 WaterColor(Season season)
{
    switch (season)
    {
        case Season::Winter: return Rgb(194, 240, 255);
        case Season::Spring:
        case Season::Summer: return Rgb(72, 138, 202);
        case Season::Autumn: return Rgb(85, 120, 155);
    }
    return Rgb(72, 138, 202);
}
} // namespace

glm::vec3 RoomView::SeasonAccent(Season season)
{
    switch (season)
    {
        case Season::Spring: return Rgb(114, 201, 120);
        case Season::Summer: return Rgb(245, 191, 78);
        case Season::Autumn: return Rgb(225, 122, 57);
        case Season::Winter: return Rgb(149, 190, 255);
    }
    return Rgb(114, 201, 120);
}

glm::vec3 RoomView::SeasonBackground(Season season)
{
    switch (season)
    {
        case Season::Spring: return Rgb(24, 45, 34);
        case Season::Summer: return Rgb(52, 55, 22);
        case Season::Autumn: return Rgb(55, 34, 24);
        case Season::Winter: return Rgb(25, 34, 56);
    }
    return Rgb(24, 45, 34);
}

glm::vec3 RoomView::FlashedBackground(Season season, int flashIntensity)
{
    const float t = static_cast<float>(std::clamp(flashIntensity, 0, 255)) / 255.0F;
    return glm::mix(SeasonBackground(season), SeasonAccent(season), t);
}

void RoomView::AddOutlined(RoomFrame& frame, const Rect& rect, const glm::vec3& fill, const glm::vec3& edge)
{
    constexpr int kEdge = 2;
    frame.rects.push_back({rect, edge});
    if (rect.w > 2 * kEdge && rect.h > 2 * kEdge)
    {
        frame.rects.push_back({Rect{rect.x + kEdge, rect.y + kEdge, rect.w - 2 * kEdge, rect.h - 2 * kEdge}, fill});
    }
}

RoomFrame RoomView::Compose(const gameplay::RunSnapshot& snapshot) const
{
    RoomFrame frame;
    const Season season = snapshot.season;
    frame.clearColor = FlashedBackground(season, snapshot.flashIntensity);

    // Frozen water is also listed among active platforms; draw it once, as ice.
    for (const Rect& water : snapshot.water)
    {
        if (season == Season::Winter)
        {
            AddOutlined(frame, water, WaterColor(season), Rgb(230, 248, 255));
        }
        else
        {
            frame.rects.push_back({water, WaterColor(season)});
        }
    }

    for (const Rect& hazard : snapshot.hazards)
    {
        frame.rects.push_back({hazard, snapshot.hazardsActive ? kHazardActiveColor : kHazardDormantColor});
        if (!snapshot.hazardsActive)
        {
            continue;
        }
        for (int x = hazard.Left(); x < hazard.Right(); x += kTipSpacing)
        {
            const int tipX = x + kTipSpacing / 2 - kTipWidth / 2;
            const int tipW = std::min(kTipWidth, hazard.Right() - tipX);
            frame.rects.push_back({Rect{tipX, hazard.Top(), tipW, hazard.h / 2}, kHazardTipColor});
        }
    }

    if (season == Season::Autumn)
    {
        const glm::vec3 tint = glm::mix(frame.clearColor, Rgb(230, 134, 64), 50.0F / 255.0F);
        for (const Rect& zone : snapshot.wind)
        {
            frame.rects.push_back({zone, tint});
        }
    }

    for (const Rect& platform : snapshot.activePlatforms)
    {
        const bool isFrozenWater = season == Season::Winter
            && std::any_of(snapshot.water.begin(), snapshot.water.end(), [&](const Rect& w) { return w == platform; });
        if (!isFrozenWater)
        {
            frame.rects.push_back({platform, kPlatformColor});
        }
    }

    AddOutlined(frame, snapshot.exit, kExitColor, kExitEdgeColor);
    AddOutlined(frame, snapshot.actorBox, kActorColor, kActorEdgeColor);

    AddHud(frame, snapshot);
    if (snapshot.outcome != gameplay::RunOutcome::InProgress)
    {
        AddEndBanner(frame, snapshot);
    }
    return frame;
}

void RoomView::AddHud(RoomFrame& frame, const gameplay::RunSnapshot& snapshot)
{
    frame.rects.push_back({Rect{16, 12, 440, 40}, kHudPanelColor});
    frame.rects.push_back({Rect{26, 22, 20, 20}, SeasonAccent(snapshot.season)});

    // Room progress pips.
    for (std::size_t i = 0; i < snapshot.roomCount; ++i)
    {
        const bool cleared = i < snapshot.roomIndex;
        const bool current = i == snapshot.roomIndex;
        const glm::vec3 color = cleared ? kWonColor : (current ? kExitColor : kHazardDormantColor);
        frame.rects.push_back({Rect{60 + static_cast<int>(i) * 22, 26, 16, 12}, color});
    }

    if (snapshot.cooldownRemainingMs > 0)
    {
        const int width = static_cast<int>(
            static_cast<long long>(kCooldownBarWidth) * std::min<long long>(snapshot.cooldownRemainingMs, 1000) / 1000);
        frame.rects.push_back({Rect{240, 28, std::max(1, width), 8}, kCooldownColor});
    }
}

void RoomView::AddEndBanner(RoomFrame& frame, const gameplay::RunSnapshot& snapshot)
{
    const bool won = snapshot.outcome == gameplay::RunOutcome::Won;
    const Rect banner{180, 190, 600, 160};
    frame.rects.push_back({banner, glm::mix(frame.clearColor, glm::vec3{0.0F}, 170.0F / 255.0F)});
    frame.rects.push_back({Rect{banner.x, banner.y, banner.w, 8}, won ? kWonColor : kFailedColor});
    frame.rects.push_back({Rect{banner.x, banner.Bottom() - 8, banner.w, 8}, won ? kWonColor : kFailedColor});
}
} // namespace game::ui
