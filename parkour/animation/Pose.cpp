#include "parkour/animation/Pose.hpp"

#include "parkour/animation/AnimationClip.hpp"

namespace parkour::animation
{

namespace
{
constexpr float kWeightEpsilon = 1.0e-6F;
} // namespace

const std::array<PoseId, kPoseCount>& AllPoses()
{
    static const std::array<PoseId, kPoseCount> kPoses{
        PoseId::Idle,
        PoseId::WalkLeftFootForward,
        PoseId::WalkRightFootForward,
        PoseId::RunLeftFootForward,
        PoseId::RunRightFootForward,
        PoseId::JumpTakeoff,
        PoseId::JumpAirborne,
        PoseId::JumpLanding,
        PoseId::RollLeft,
        PoseId::RollRight,
        PoseId::AttackPunch,
        PoseId::AttackKick,
        PoseId::Crouch,
    };
    return kPoses;
}

const char* PoseDisplayName(PoseId pose)
{
    switch (pose)
    {
        case PoseId::Idle: return "Idle";
        case PoseId::WalkLeftFootForward: return "Walk Left";
        case PoseId::WalkRightFootForward: return "Walk Right";
        case PoseId::RunLeftFootForward: return "Run Left";
        case PoseId::RunRightFootForward: return "Run Right";
        case PoseId::JumpTakeoff: return "Jump Takeoff";
        case PoseId::JumpAirborne: return "Jump Airborne";
        case PoseId::JumpLanding: return "Jump Landing";
        case PoseId::RollLeft: return "Roll Left";
        case PoseId::RollRight: return "Roll Right";
        case PoseId::AttackPunch: return "Attack Punch";
        case PoseId::AttackKick: return "Attack Kick";
        case PoseId::Crouch: return "Crouch";
        default: return "Idle";
    }
}

const char* PoseFileStem(PoseId pose)
{
    switch (pose)
    {
        case PoseId::Idle: return "idle";
        case PoseId::WalkLeftFootForward: return "walk_left";
        case PoseId::WalkRightFootForward: return "walk_right";
        case PoseId::RunLeftFootForward: return "run_left";
        case PoseId::RunRightFootForward: return "run_right";
        case PoseId::JumpTakeoff: return "jump_takeoff";
        case PoseId::JumpAirborne: return "jump_airborne";
        case PoseId::JumpLanding: return "jump_landing";
        case PoseId::RollLeft: return "roll_left";
        case PoseId::RollRight: return "roll_right";
        case PoseId::AttackPunch: return "attack_punch";
        case PoseId::AttackKick: return "attack_kick";
        case PoseId::Crouch: return "crouch";
        default: return "idle";
    }
}

std::optional<PoseId> ParsePoseFileStem(std::string_view stem)
{
    for (const PoseId pose : AllPoses())
    {
        if (stem == PoseFileStem(pose))
        {
            return pose;
        }
    }
    return std::nullopt;
}

BoneTransform BoneTransform::FromTransform(const scene::Transform& transform)
{
    return BoneTransform{transform.position, transform.rotation, transform.scale};
}

scene::Transform BoneTransform::ToTransform() const
{
    scene::Transform transform;
    transform.position = translation;
    transform.rotation = rotation;
    transform.scale = scale;
    return transform;
}

BoneTransform Blend(const BoneTransform& a, const BoneTransform& b, float weight)
{
    BoneTransform result;
    result.translation = a.translation + (b.translation - a.translation) * weight;
    result.rotation = SlerpShortest(a.rotation, b.rotation, weight);
    result.scale = a.scale + (b.scale - a.scale) * weight;
    return result;
}

Pose& Pose::WithBone(const std::string& boneName, const BoneTransform& transform)
{
    boneTransforms[boneName] = transform;
    return *this;
}

Pose Pose::Blend(const Pose& other, float weight) const
{
    Pose result;
    result.name = name + "_" + other.name + "_blend";

    for (const auto& [boneName, transformA] : boneTransforms)
    {
        const auto otherIt = other.boneTransforms.find(boneName);
        if (otherIt != other.boneTransforms.end())
        {
            result.boneTransforms[boneName] = animation::Blend(transformA, otherIt->second, weight);
        }
        else
        {
            result.boneTransforms[boneName] = transformA;
        }
    }

    for (const auto& [boneName, transformB] : other.boneTransforms)
    {
        if (!boneTransforms.contains(boneName))
        {
            result.boneTransforms[boneName] = transformB;
        }
    }

    return result;
}

std::optional<Pose> Pose::BlendMultiple(const std::vector<std::pair<const Pose*, float>>& poses)
{
    std::optional<Pose> result;
    float totalWeight = 0.0F;

    for (const auto& [pose, weight] : poses)
    {
        if (pose == nullptr)
        {
            continue;
        }
        if (!result.has_value())
        {
            result = *pose;
            totalWeight = weight;
            continue;
        }

        const float combined = totalWeight + weight;
        if (combined <= kWeightEpsilon)
        {
            continue;
        }
        result = result->Blend(*pose, weight / combined);
        totalWeight = combined;
    }

    return result;
}

} // namespace parkour::animation
