#include "game/world/SeasonCycle.hpp"

#include <algorithm>

namespace game::world
{
SeasonCycle::SeasonCycle(TimestampMs cooldownMs, Season initial)
    : m_active(initial)
    , m_cooldownMs(std::max<TimestampMs>(0, cooldownMs))
    , m_lastCycleMs(-m_cooldownMs)
{
}

bool SeasonCycle::CanCycle(TimestampMs nowMs) const
{
    return nowMs - m_lastCycleMs >= m_cooldownMs;
}

bool SeasonCycle::RequestCycle(TimestampMs nowMs)
{
    if (!CanCycle(nowMs))
    {
        return false;
    }

    m_active = NextSeason(m_active);
    m_lastCycleMs = nowMs;
    m_flashIntensity = kFlashPeak;
    return true;
}

TimestampMs SeasonCycle::CooldownRemainingMs(TimestampMs nowMs) const
{
    return std::max<TimestampMs>(0, m_cooldownMs - (nowMs - m_lastCycleMs));
}

void SeasonCycle::Update()
{
    if (m_flashIntensity > 0)
    {
        m_flashIntensity = std::max(0, m_flashIntensity - kFlashDecayPerFrame);
    }
}
} // namespace game::world
