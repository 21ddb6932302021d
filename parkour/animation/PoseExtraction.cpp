#include "parkour/animation/PoseExtraction.hpp"

#include <algorithm>
#include <iostream>

namespace parkour::animation
{

std::vector<ExtractionEntry> DefaultExtractionTable()
{
    return {
        {"idle", 0.5F, PoseId::Idle, "Neutral standing pose"},
        {"walk", 0.25F, PoseId::WalkLeftFootForward, "Left foot forward, right foot back"},
        {"walk", 0.75F, PoseId::WalkRightFootForward, "Right foot forward, left foot back"},
        {"run", 0.2F, PoseId::RunLeftFootForward, "Left foot forward, running"},
        {"run", 0.6F, PoseId::RunRightFootForward, "Right foot forward, running"},
        {"standing_jump", 0.1F, PoseId::JumpTakeoff, "Crouch before jump"},
        {"standing_jump", 0.5F, PoseId::JumpAirborne, "Mid-air"},
        {"standing_jump", 0.9F, PoseId::JumpLanding, "Landing crouch"},
        // Placeholders until roll and attack clips exist
        {"idle", 0.0F, PoseId::RollLeft, "Placeholder from idle"},
        {"idle", 0.0F, PoseId::RollRight, "Placeholder from idle"},
        {"idle", 0.0F, PoseId::AttackPunch, "Placeholder from idle"},
        {"idle", 0.0F, PoseId::AttackKick, "Placeholder from idle"},
        {"idle", 0.3F, PoseId::Crouch, "Slight crouch from idle"},
    };
}

Pose SamplePose(const AnimationClip& clip, const std::vector<std::string>& nodeNames, float time, const std::string& poseName)
{
    Pose pose;
    pose.name = poseName;

    const float sampleTime = std::clamp(time, 0.0F, std::max(0.0F, clip.duration));
    for (const int joint : clip.AnimatedJoints())
    {
        if (joint < 0 || static_cast<std::size_t>(joint) >= nodeNames.size() || nodeNames[joint].empty())
        {
            continue;
        }

        BoneTransform transform;
        clip.SampleTranslation(joint, sampleTime, transform.translation);
        clip.SampleRotation(joint, sampleTime, transform.rotation);
        clip.SampleScale(joint, sampleTime, transform.scale);
        pose.boneTransforms[nodeNames[joint]] = transform;
    }

    pose.metadata.sourceAnimation = clip.name;
    pose.metadata.sourceTime = sampleTime;
    return pose;
}

std::size_t ExtractPoses(
    const std::vector<ExtractionEntry>& table,
    const ClipLookup& findClip,
    const std::vector<std::string>& nodeNames,
    PoseLibrary& library
)
{
    std::size_t extracted = 0;
    for (const ExtractionEntry& entry : table)
    {
        const AnimationClip* clip = findClip ? findClip(entry.clipName) : nullptr;
        if (clip == nullptr)
        {
            std::cerr << "[PoseLibrary] Warning: clip '" << entry.clipName << "' not found for pose "
                      << PoseDisplayName(entry.pose) << "\n";
            continue;
        }

        Pose pose = SamplePose(*clip, nodeNames, entry.timeSeconds, PoseFileStem(entry.pose));
        if (!entry.notes.empty())
        {
            pose.metadata.notes = entry.notes;
        }
        std::cout << "[PoseLibrary] Extracted " << PoseDisplayName(entry.pose) << " from " << entry.clipName << " @ "
                  << entry.timeSeconds << "s (" << pose.boneTransforms.size() << " bones)\n";
        library.AddPose(entry.pose, std::move(pose));
        ++extracted;
    }
    return extracted;
}

} // namespace parkour::animation
