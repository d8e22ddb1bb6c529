#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

namespace game::world
{
enum class Season : std::uint8_t
{
    Spring = 0,
    Summer,
    Autumn,
    Winter
};

inline constexpr std::size_t kSeasonCount = 4;

inline constexpr std::array<Season, kSeasonCount> kSeasonOrder{
    Season::Spring,
    Season::Summer,
    Season::Autumn,
    Season::Winter,
};

[[nodiscard]] constexpr Season NextSeason(Season season)
{
    return kSeasonOrder[(static_cast<std::size_t>(season) + 1) % kSeasonCount];
}

/// Small bit set of seasons, used to tag season-conditional geometry.
class SeasonMask
{
public:
    constexpr SeasonMask() = default;

    [[nodiscard]] static constexpr SeasonMask Of(std::initializer_list<Season> seasons)
    {
        SeasonMask mask;
        for (const Season season : seasons)
        {
            mask.Add(season);
        }
        return mask;
    }

    [[nodiscard]] static constexpr SeasonMask All()
    {
        return Of({Season::Spring, Season::Summer, Season::Autumn, Season::Winter});
    }

    constexpr void Add(Season season) { m_bits = static_cast<std::uint8_t>(m_bits | Bit(season)); }
    [[nodiscard]] constexpr bool Contains(Season season) const { return (m_bits & Bit(season)) != 0; }
    [[nodiscard]] constexpr bool IsEmpty() const { return m_bits == 0; }
    [[nodiscard]] constexpr std::uint8_t Bits() const { return m_bits; }

    [[nodiscard]] constexpr bool operator==(const SeasonMask& other) const { return m_bits == other.m_bits; }

private:
    [[nodiscard]] static constexpr std::uint8_t Bit(Season season)
    {
        return static_cast<std::uint8_t>(1U << static_cast<unsigned>(season));
    }

    std::uint8_t m_bits = 0;
};

[[nodiscard]] const char* SeasonToText(Season season);
[[nodiscard]] const char* SeasonToId(Season season);
[[nodiscard]] std::optional<Season> ParseSeason(const std::string& text);
} // namespace game::world
