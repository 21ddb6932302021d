#include "parkour/animation/PoseBlender.hpp"

#include "parkour/animation/MotionClassifier.hpp"

#include <algorithm>
#include <cmath>

namespace parkour::animation
{

const char* ContactStateToString(ContactState state)
{
    switch (state)
    {
        case ContactState::Grounded: return "Grounded";
        case ContactState::Airborne: return "Airborne";
        case ContactState::Landing: return "Landing";
        default: return "Grounded";
    }
}

float PoseBlendState::WeightSum() const
{
    float sum = 0.0F;
    for (const PoseWeight& entry : activePoses)
    {
        sum += entry.weight;
    }
    return sum;
}

float MovementRamp(float speed, const SpeedThresholds& thresholds)
{
    const float range = thresholds.walkSpeed - thresholds.idleThreshold;
    if (range <= 0.0F)
    {
        return speed >= thresholds.walkSpeed ? 1.0F : 0.0F;
    }
    return std::clamp((speed - thresholds.idleThreshold) / range, 0.0F, 1.0F);
}

float WalkRunRamp(float speed, const SpeedThresholds& thresholds)
{
    const float range = thresholds.runSpeed - thresholds.walkSpeed;
    if (range <= 0.0F)
    {
        return speed >= thresholds.runSpeed ? 1.0F : 0.0F;
    }
    return std::clamp((speed - thresholds.walkSpeed) / range, 0.0F, 1.0F);
}

LocomotionWeights ComputeLocomotionWeights(float speed, const SpeedThresholds& thresholds)
{
    LocomotionWeights weights;
    weights.movement = MovementRamp(speed, thresholds);
    weights.walkRun = WalkRunRamp(speed, thresholds);
    return weights;
}

float CycleFrequency(MotionKind kind, float speed, const BlendingConfig& config)
{
    switch (kind)
    {
        case MotionKind::Walking:
            return std::max(0.0F, config.cycle.walkBaseHz + config.cycle.walkSlope * (speed - config.thresholds.idleThreshold));
        case MotionKind::Running:
            return std::max(0.0F, config.cycle.runBaseHz + config.cycle.runSlope * (speed - config.thresholds.walkSpeed));
        case MotionKind::Idle:
        case MotionKind::Jumping:
        default:
            return 0.0F;
    }
}

float AdvanceFootPhase(float phase, float frequency, float dt)
{
    float next = std::fmod(phase + frequency * dt, 1.0F);
    if (!std::isfinite(next))
    {
        return 0.0F;
    }
    if (next < 0.0F)
    {
        next += 1.0F;
    }
    // fmod of a tiny negative can round up to exactly 1
    if (next >= 1.0F)
    {
        next = 0.0F;
    }
    return next;
}

std::vector<PoseWeight> CyclePoseWeights(PoseId leftForward, PoseId rightForward, float phase)
{
    if (phase < 0.5F)
    {
        const float t = phase * 2.0F;
        return {PoseWeight{leftForward, 1.0F - t}, PoseWeight{rightForward, t}};
    }

    const float t = (phase - 0.5F) * 2.0F;
    return {PoseWeight{rightForward, 1.0F - t}, PoseWeight{leftForward, t}};
}

PoseBlender::PoseBlender(const BlendingConfig& config)
    : m_config(&config), m_stride(config.stride, config.thresholds)
{
}

ContactState PoseBlender::UpdateContact(bool grounded, float dt, BlendTrack& track) const
{
    ContactState contact = ContactState::Grounded;
    if (!grounded)
    {
        contact = ContactState::Airborne;
        track.landingRemaining = 0.0F;
    }
    else
    {
        if (!track.wasGrounded)
        {
            track.landingRemaining = m_config->landingDuration;
        }
        if (track.landingRemaining > 0.0F)
        {
            contact = ContactState::Landing;
            track.landingRemaining = std::max(0.0F, track.landingRemaining - dt);
        }
    }

    track.wasGrounded = grounded;
    return contact;
}

StateTransition PoseBlender::Tick(
    const AnimationState& state,
    const scene::CharacterMotionComponent& motion,
    float dt,
    BlendTrack& track,
    PoseBlendState& blend
) const
{
    const StateTransition transition = track.animating.UpdateByDiscriminant(state);
    const float speed = HorizontalSpeed(motion.velocity);

    blend.velocity = speed;
    blend.contactState = UpdateContact(motion.grounded, dt, track);

    if (transition.directive == StateDirective::Alter)
    {
        if (state.kind == MotionKind::Jumping)
        {
            JumpContext jump;
            if (transition.previous.has_value())
            {
                jump.priorKind = transition.previous->kind;
                jump.wasMoving = transition.previous->IsMoving();
            }
            blend.jump = jump;
        }
        else
        {
            blend.jump.reset();
        }

        if (state.kind == MotionKind::Idle)
        {
            blend.locomotion = LocomotionWeights{};
        }
    }

    // Both moving states carry a speed-dependent mix, recomputed on Maintain as well
    if (state.IsMoving())
    {
        const float rampSpeed = state.kind == MotionKind::Running ? state.speed : speed;
        blend.locomotion = ComputeLocomotionWeights(rampSpeed, m_config->thresholds);
    }

    if (motion.grounded && state.IsMoving())
    {
        blend.footPhase = AdvanceFootPhase(blend.footPhase, CycleFrequency(state.kind, speed, *m_config), dt);
    }

    blend.strideLength = m_stride.StrideLength(speed, motion.groundNormal);
    blend.activePoses = SelectPoses(state, blend);
    return transition;
}

std::vector<PoseWeight> PoseBlender::SelectPoses(const AnimationState& state, const PoseBlendState& blend) const
{
    switch (blend.contactState)
    {
        case ContactState::Airborne: return {PoseWeight{PoseId::JumpAirborne, 1.0F}};
        case ContactState::Landing: return {PoseWeight{PoseId::JumpLanding, 1.0F}};
        case ContactState::Grounded:
        default:
            break;
    }

    switch (state.kind)
    {
        case MotionKind::Walking:
            return CyclePoseWeights(PoseId::WalkLeftFootForward, PoseId::WalkRightFootForward, blend.footPhase);
        case MotionKind::Running:
            return CyclePoseWeights(PoseId::RunLeftFootForward, PoseId::RunRightFootForward, blend.footPhase);
        case MotionKind::Jumping: return {PoseWeight{PoseId::JumpTakeoff, 1.0F}};
        case MotionKind::Idle:
        default:
            return {PoseWeight{PoseId::Idle, 1.0F}};
    }
}

} // namespace parkour::animation
