#pragma once

#include <cstdint>

namespace engine::core
{
/// Fixed-step frame clock. Wall-clock frame times feed an accumulator that is
/// drained in whole fixed steps; simulation time only advances per consumed step.
class Time
{
public:
    explicit Time(double fixedDeltaSeconds = 1.0 / 60.0);

    void SetFixedTickRate(int ticksPerSecond);

    void BeginFrame(double nowSeconds);
    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();
    void Reset();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }
    [[nodiscard]] unsigned long long FixedStepIndex() const { return m_fixedStepIndex; }

    /// Monotonic simulation timestamp in milliseconds, advanced by ConsumeFixedStep only.
    [[nodiscard]] std::int64_t SimulationMilliseconds() const;

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds;
    double m_totalSeconds;
    double m_lastFrameSeconds;
    double m_accumulator;
    unsigned long long m_frameIndex;
    unsigned long long m_fixedStepIndex;
    bool m_firstFrame;
};
} // namespace engine::core
