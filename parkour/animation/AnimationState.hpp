#pragma once

#include <optional>
#include <string>

namespace parkour::animation
{

enum class MotionKind
{
    Idle,
    Walking,
    Running,
    Jumping
};

[[nodiscard]] const char* MotionKindToString(MotionKind kind);

// Discrete locomotion state of one character.
// Only Running carries a payload; two states with the same kind but different
// speeds are the same discriminant.
struct AnimationState
{
    MotionKind kind = MotionKind::Idle;
    float speed = 0.0F;

    [[nodiscard]] static AnimationState Idle() { return AnimationState{MotionKind::Idle, 0.0F}; }
    [[nodiscard]] static AnimationState Walking() { return AnimationState{MotionKind::Walking, 0.0F}; }
    [[nodiscard]] static AnimationState Running(float speed);
    [[nodiscard]] static AnimationState Jumping() { return AnimationState{MotionKind::Jumping, 0.0F}; }

    [[nodiscard]] bool SameDiscriminant(const AnimationState& other) const { return kind == other.kind; }
    [[nodiscard]] bool IsMoving() const { return kind == MotionKind::Walking || kind == MotionKind::Running; }

    [[nodiscard]] bool operator==(const AnimationState& other) const
    {
        return kind == other.kind && speed == other.speed;
    }
};

// "Idle", "Walking", "Running(3.50)", "Jumping"
[[nodiscard]] std::string ToString(const AnimationState& state);

enum class StateDirective
{
    Maintain,
    Alter
};

struct StateTransition
{
    StateDirective directive = StateDirective::Alter;
    std::optional<AnimationState> previous;
    AnimationState state;
};

// Tracks the last state by discriminant, telling callers whether the variant changed
class AnimatingState
{
public:
    // The first update always yields Alter with no previous state
    StateTransition UpdateByDiscriminant(const AnimationState& next);

    [[nodiscard]] const std::optional<AnimationState>& Current() const { return m_current; }
    void Reset() { m_current.reset(); }

private:
    std::optional<AnimationState> m_current;
};

} // namespace parkour::animation
