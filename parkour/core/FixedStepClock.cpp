#include "parkour/core/FixedStepClock.hpp"

#include <algorithm>

namespace parkour::core
{
FixedStepClock::FixedStepClock(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(1.0 / 60.0)
    , m_accumulator(0.0)
    , m_simulatedSeconds(0.0)
    , m_stepIndex(0)
{
    SetFixedDeltaSeconds(fixedDeltaSeconds);
}

void FixedStepClock::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, 1.0 / 240.0, 1.0 / 15.0);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void FixedStepClock::AdvanceFrame(double frameSeconds)
{
    m_accumulator += std::clamp(frameSeconds, 0.0, kMaxFrameSeconds);
}

bool FixedStepClock::ShouldStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void FixedStepClock::ConsumeStep()
{
    m_accumulator = std::max(0.0, m_accumulator - m_fixedDeltaSeconds);
    m_simulatedSeconds += m_fixedDeltaSeconds;
    ++m_stepIndex;
}
} // namespace parkour::core
