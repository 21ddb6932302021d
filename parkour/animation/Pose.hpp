#pragma once

#include "parkour/scene/Components.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

namespace parkour::animation
{

// Canonical keyframe poses used by procedural blending
enum class PoseId
{
    Idle,
    WalkLeftFootForward,
    WalkRightFootForward,
    RunLeftFootForward,
    RunRightFootForward,
    JumpTakeoff,
    JumpAirborne,
    JumpLanding,
    RollLeft,
    RollRight,
    AttackPunch,
    AttackKick,
    Crouch
};

inline constexpr std::size_t kPoseCount = 13;

[[nodiscard]] const std::array<PoseId, kPoseCount>& AllPoses();
[[nodiscard]] const char* PoseDisplayName(PoseId pose);
// File name without extension, e.g. "walk_left"
[[nodiscard]] const char* PoseFileStem(PoseId pose);
[[nodiscard]] std::optional<PoseId> ParsePoseFileStem(std::string_view stem);

// Local TRS of one bone
struct BoneTransform
{
    glm::vec3 translation{0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F};

    [[nodiscard]] static BoneTransform FromTransform(const scene::Transform& transform);
    [[nodiscard]] scene::Transform ToTransform() const;
};

// Translation and scale lerp, rotation shortest-arc slerp
[[nodiscard]] BoneTransform Blend(const BoneTransform& a, const BoneTransform& b, float weight);

struct PoseMetadata
{
    std::optional<std::string> sourceAnimation;
    std::optional<float> sourceFrame;
    std::optional<float> sourceTime;
    std::optional<std::string> notes;
};

struct Pose
{
    std::string name;
    std::unordered_map<std::string, BoneTransform> boneTransforms;  // bone name -> local transform
    PoseMetadata metadata;

    Pose& WithBone(const std::string& boneName, const BoneTransform& transform);

    // Bones present in only one pose are copied through unchanged
    [[nodiscard]] Pose Blend(const Pose& other, float weight) const;

    // Progressive pairwise blend; nullopt for an empty list
    [[nodiscard]] static std::optional<Pose> BlendMultiple(const std::vector<std::pair<const Pose*, float>>& poses);
};

} // namespace parkour::animation
