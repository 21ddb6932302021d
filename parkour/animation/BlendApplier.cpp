#include "parkour/animation/BlendApplier.hpp"

#include "parkour/targeting/TargetBone.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace parkour::animation
{

void BlendApplier::EnsureLooping(AnimationPlayback& playback, LocomotionClip clip, float weight) const
{
    const std::string& name = m_config->clips.For(clip);
    if (!playback.IsPlaying(name))
    {
        playback.Play(name, m_config->crossfade.locomotion);
    }
    playback.SetLooping(name, true);
    playback.SetWeight(name, weight);
}

void BlendApplier::ApplyPlayback(const StateTransition& transition, const PoseBlendState& blend, AnimationPlayback& playback) const
{
    const ClipNames& clips = m_config->clips;
    const bool altered = transition.directive == StateDirective::Alter;

    if (transition.state.kind == MotionKind::Jumping)
    {
        if (!altered)
        {
            return;
        }

        const JumpContext jump = blend.jump.value_or(JumpContext{});
        playback.Stop(clips.idle);
        playback.Stop(clips.walk);
        playback.Stop(clips.run);
        playback.Stop(clips.For(jump.OtherVariant()));

        const std::string& variant = clips.For(jump.Variant());
        playback.Play(variant, m_config->crossfade.jump);
        playback.SetLooping(variant, false);
        playback.SetWeight(variant, 1.0F);

        if (m_config->verboseTrace)
        {
            std::cout << "[Locomotion] Jump '" << variant << "' from " << MotionKindToString(jump.priorKind) << "\n";
        }
        return;
    }

    if (altered && transition.previous.has_value() && transition.previous->kind == MotionKind::Jumping)
    {
        playback.Stop(clips.standingJump);
        playback.Stop(clips.runningJump);
    }

    EnsureLooping(playback, LocomotionClip::Idle, blend.locomotion.Idle());
    EnsureLooping(playback, LocomotionClip::Walk, blend.locomotion.Walk());
    EnsureLooping(playback, LocomotionClip::Run, blend.locomotion.Run());
}

std::optional<Pose> BlendApplier::EvaluatePose(const PoseBlendState& blend, const PoseLibrary& library)
{
    std::vector<std::pair<const Pose*, float>> weighted;
    weighted.reserve(blend.activePoses.size());
    for (const PoseWeight& entry : blend.activePoses)
    {
        const Pose* pose = library.Get(entry.pose);
        if (pose != nullptr && entry.weight > 0.0F)
        {
            weighted.emplace_back(pose, entry.weight);
        }
    }
    return Pose::BlendMultiple(weighted);
}

std::size_t BlendApplier::ApplyPose(
    const PoseBlendState& blend,
    const PoseLibrary& library,
    scene::World& world,
    scene::Entity root
) const
{
    const std::optional<Pose> pose = EvaluatePose(blend, library);
    if (!pose.has_value())
    {
        return 0;
    }

    std::size_t written = 0;
    world.VisitDescendants(root, [&world, &pose, &written](scene::Entity entity) {
        const std::string* name = world.NameOf(entity);
        if (name == nullptr)
        {
            return;
        }

        auto it = pose->boneTransforms.find(*name);
        if (it == pose->boneTransforms.end())
        {
            // Poses saved from an unprefixed rig still apply to "prefix:Bone" nodes
            it = pose->boneTransforms.find(std::string(targeting::StripBonePrefix(*name)));
        }
        if (it == pose->boneTransforms.end())
        {
            return;
        }

        world.Transforms()[entity] = it->second.ToTransform();
        ++written;
    });
    return written;
}

} // namespace parkour::animation
