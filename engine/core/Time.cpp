#include "engine/core/Time.hpp"

#include <algorithm>
#include <cmath>

namespace engine::core
{
namespace
{
constexpr double kMaxFrameDeltaSeconds = 0.25;
}

Time::Time(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(fixedDeltaSeconds)
    , m_deltaSeconds(0.0)
    , m_totalSeconds(0.0)
    , m_lastFrameSeconds(0.0)
    , m_accumulator(0.0)
    , m_frameIndex(0)
    , m_fixedStepIndex(0)
    , m_firstFrame(true)
{
}

void Time::SetFixedTickRate(int ticksPerSecond)
{
    const int clampedRate = std::clamp(ticksPerSecond, 15, 240);
    m_fixedDeltaSeconds = 1.0 / static_cast<double>(clampedRate);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    const double rawDelta = nowSeconds - m_lastFrameSeconds;
    m_deltaSeconds = std::clamp(rawDelta, 0.0, kMaxFrameDeltaSeconds);
    m_lastFrameSeconds = nowSeconds;
    m_totalSeconds += m_deltaSeconds;
    m_accumulator += m_deltaSeconds;
    ++m_frameIndex;
}

bool Time::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void Time::ConsumeFixedStep()
{
    m_accumulator -= m_fixedDeltaSeconds;
    if (m_accumulator < 0.0)
    {
        m_accumulator = 0.0;
    }
    ++m_fixedStepIndex;
}

void Time::Reset()
{
    m_deltaSeconds = 0.0;
    m_totalSeconds = 0.0;
    m_accumulator = 0.0;
    m_frameIndex = 0;
    m_fixedStepIndex = 0;
    m_firstFrame = true;
}

std::int64_t Time::SimulationMilliseconds() const
{
    return static_cast<std::int64_t>(std::llround(static_cast<double>(m_fixedStepIndex) * m_fixedDeltaSeconds * 1000.0));
}
} // namespace engine::core
