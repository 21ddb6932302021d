#pragma once

#include "parkour/animation/AnimationState.hpp"
#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/animation/Pose.hpp"
#include "parkour/animation/Stride.hpp"
#include "parkour/scene/Components.hpp"

#include <optional>
#include <vector>

namespace parkour::animation
{

enum class ContactState
{
    Grounded,
    Airborne,
    Landing
};

[[nodiscard]] const char* ContactStateToString(ContactState state);

struct PoseWeight
{
    PoseId pose = PoseId::Idle;
    float weight = 0.0F;
};

// Two independent ramps over the speed axis. Clip weights derived from them
// always sum to one.
struct LocomotionWeights
{
    float movement = 0.0F;  // 0 = idle, 1 = moving
    float walkRun = 0.0F;   // 0 = walk, 1 = run

    [[nodiscard]] float Idle() const { return 1.0F - movement; }
    [[nodiscard]] float Walk() const { return movement * (1.0F - walkRun); }
    [[nodiscard]] float Run() const { return movement * walkRun; }
};

// What the character was doing when the jump started
struct JumpContext
{
    MotionKind priorKind = MotionKind::Idle;
    bool wasMoving = false;

    [[nodiscard]] LocomotionClip Variant() const
    {
        return wasMoving ? LocomotionClip::RunningJump : LocomotionClip::StandingJump;
    }
    [[nodiscard]] LocomotionClip OtherVariant() const
    {
        return wasMoving ? LocomotionClip::StandingJump : LocomotionClip::RunningJump;
    }
};

// Per-character output of the blender, readable by any other system
struct PoseBlendState
{
    std::vector<PoseWeight> activePoses{PoseWeight{PoseId::Idle, 1.0F}};
    float velocity = 0.0F;  // horizontal speed
    ContactState contactState = ContactState::Grounded;
    float footPhase = 0.0F;  // [0, 1)
    float strideLength = 0.0F;
    LocomotionWeights locomotion;
    std::optional<JumpContext> jump;

    [[nodiscard]] float WeightSum() const;
};

// Blender bookkeeping that is not part of the published state
struct BlendTrack
{
    AnimatingState animating;
    bool wasGrounded = true;
    float landingRemaining = 0.0F;
};

// (speed - idle) / (walk - idle), clamped to [0, 1]
[[nodiscard]] float MovementRamp(float speed, const SpeedThresholds& thresholds);
// (speed - walk) / (run - walk), clamped to [0, 1]
[[nodiscard]] float WalkRunRamp(float speed, const SpeedThresholds& thresholds);
[[nodiscard]] LocomotionWeights ComputeLocomotionWeights(float speed, const SpeedThresholds& thresholds);

// Steps per second for a moving state, 0 otherwise
[[nodiscard]] float CycleFrequency(MotionKind kind, float speed, const BlendingConfig& config);
// Always returns a value in [0, 1)
[[nodiscard]] float AdvanceFootPhase(float phase, float frequency, float dt);
// Linear left/right ramp across each half cycle
[[nodiscard]] std::vector<PoseWeight> CyclePoseWeights(PoseId leftForward, PoseId rightForward, float phase);

class PoseBlender
{
public:
    explicit PoseBlender(const BlendingConfig& config);

    // Advances one character by dt. The caller skips the tick entirely while the
    // character has no kinematic basis.
    StateTransition Tick(
        const AnimationState& state,
        const scene::CharacterMotionComponent& motion,
        float dt,
        BlendTrack& track,
        PoseBlendState& blend
    ) const;

    ContactState UpdateContact(bool grounded, float dt, BlendTrack& track) const;

    [[nodiscard]] const StrideCalculator& Stride() const { return m_stride; }

private:
    [[nodiscard]] std::vector<PoseWeight> SelectPoses(const AnimationState& state, const PoseBlendState& blend) const;

    const BlendingConfig* m_config;
    StrideCalculator m_stride;
};

} // namespace parkour::animation
