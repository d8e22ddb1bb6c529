#include "game/gameplay/Modifiers.hpp"

#include <algorithm>

namespace game::gameplay
{
ModifiersBuilder& ModifiersBuilder::Apply(const EchoSeedEffect& effect)
{
    m_value.speedMultiplier *= effect.speedFactor;
    m_value.gravityMultiplier *= effect.gravityFactor;
    m_value.jumpMultiplier *= effect.jumpFactor;
    m_value.waterDragMultiplier *= effect.waterDragFactor;
    m_value.iceSlip *= effect.iceSlipFactor;
    m_value.brittleThorns = m_value.brittleThorns || effect.brittleThorns;
    m_value.slowCycle = m_value.slowCycle || effect.slowCycle;

    if (effect.windPushOverride.has_value())
    {
        m_windPushOverride = m_windPushOverride.has_value()
            ? std::max(*m_windPushOverride, *effect.windPushOverride)
            : *effect.windPushOverride;
    }
    return *this;
}

Modifiers ModifiersBuilder::Build() const
{
    Modifiers result = m_value;
    if (m_windPushOverride.has_value())
    {
        result.windPush = *m_windPushOverride;
    }
    return result;
}
} // namespace game::gameplay
