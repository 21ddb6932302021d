#pragma once

#include "parkour/animation/AnimationPlayback.hpp"
#include "parkour/animation/AnimationState.hpp"
#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/animation/PoseBlender.hpp"
#include "parkour/animation/PoseLibrary.hpp"
#include "parkour/scene/World.hpp"

#include <cstddef>
#include <optional>

namespace parkour::animation
{

// Pushes blender output into a playback sink and onto skeleton bones
class BlendApplier
{
public:
    explicit BlendApplier(const BlendingConfig& config)
        : m_config(&config)
    {
    }

    // Jumps are one-shot: entering one stops every locomotion clip and the
    // unused jump variant. Otherwise idle, walk and run loop with the
    // locomotion weights.
    void ApplyPlayback(const StateTransition& transition, const PoseBlendState& blend, AnimationPlayback& playback) const;

    // Weighted blend of the active poses found in `library`
    [[nodiscard]] static std::optional<Pose> EvaluatePose(const PoseBlendState& blend, const PoseLibrary& library);

    // Writes the evaluated pose to the named bones under `root`. Returns bones written.
    std::size_t ApplyPose(const PoseBlendState& blend, const PoseLibrary& library, scene::World& world, scene::Entity root) const;

private:
    void EnsureLooping(AnimationPlayback& playback, LocomotionClip clip, float weight) const;

    const BlendingConfig* m_config = nullptr;
};

} // namespace parkour::animation
