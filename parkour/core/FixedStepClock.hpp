#pragma once

namespace parkour::core
{
// Accumulates variable frame deltas and hands out fixed simulation steps
class FixedStepClock
{
public:
    explicit FixedStepClock(double fixedDeltaSeconds = 1.0 / 60.0);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    // Feeds one rendered frame; long hitches are capped at kMaxFrameSeconds
    void AdvanceFrame(double frameSeconds);
    [[nodiscard]] bool ShouldStep() const;
    void ConsumeStep();

    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double SimulatedSeconds() const { return m_simulatedSeconds; }
    [[nodiscard]] unsigned long long StepIndex() const { return m_stepIndex; }

    static constexpr double kMaxFrameSeconds = 0.25;

private:
    double m_fixedDeltaSeconds;
    double m_accumulator;
    double m_simulatedSeconds;
    unsigned long long m_stepIndex;
};
} // namespace parkour::core
