#pragma once

#include <cstdint>

#include "game/world/Season.hpp"

namespace game::world
{
using TimestampMs = std::int64_t;

/// Active season plus the cooldown that gates cycle requests.
class SeasonCycle
{
public:
    static constexpr TimestampMs kDefaultCooldownMs = 500;
    static constexpr int kFlashPeak = 170;
    static constexpr int kFlashDecayPerFrame = 8;

    explicit SeasonCycle(TimestampMs cooldownMs = kDefaultCooldownMs, Season initial = Season::Spring);

    [[nodiscard]] Season Active() const { return m_active; }
    [[nodiscard]] TimestampMs CooldownMs() const { return m_cooldownMs; }
    [[nodiscard]] TimestampMs LastCycleMs() const { return m_lastCycleMs; }

    [[nodiscard]] bool CanCycle(TimestampMs nowMs) const;

    /// Advances one season when off cooldown. Returns false and changes nothing otherwise.
    bool RequestCycle(TimestampMs nowMs);

    [[nodiscard]] TimestampMs CooldownRemainingMs(TimestampMs nowMs) const;

    /// Per-frame cosmetic update; decays the flash intensity.
    void Update();
    [[nodiscard]] int FlashIntensity() const { return m_flashIntensity; }

private:
    Season m_active;
    TimestampMs m_cooldownMs;
    TimestampMs m_lastCycleMs;
    int m_flashIntensity = 0;
};
} // namespace game::world
