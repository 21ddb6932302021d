#include "parkour/animation/AnimationState.hpp"

#include <algorithm>
#include <cstdio>

namespace parkour::animation
{

const char* MotionKindToString(MotionKind kind)
{
    switch (kind)
    {
        case MotionKind::Idle: return "Idle";
        case MotionKind::Walking: return "Walking";
        case MotionKind::Running: return "Running";
        case MotionKind::Jumping: return "Jumping";
        default: return "Idle";
    }
}

AnimationState AnimationState::Running(float speed)
{
    return AnimationState{MotionKind::Running, std::max(0.0F, speed)};
}

std::string ToString(const AnimationState& state)
{
    if (state.kind != MotionKind::Running)
    {
        return MotionKindToString(state.kind);
    }

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "Running(%.2f)", state.speed);
    return buffer;
}

StateTransition AnimatingState::UpdateByDiscriminant(const AnimationState& next)
{
    StateTransition transition;
    transition.state = next;
    transition.previous = m_current;

    if (m_current.has_value() && m_current->SameDiscriminant(next))
    {
        transition.directive = StateDirective::Maintain;
    }
    else
    {
        transition.directive = StateDirective::Alter;
    }

    m_current = next;
    return transition;
}

} // namespace parkour::animation
