#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parkour::targeting
{

// Bones that can be driven towards a world-space target
enum class TargetBone
{
    LeftFoot,
    RightFoot,
    LeftHand,
    RightHand,
    Head,
    Hips
};

inline constexpr std::array<TargetBone, 6> kAllTargetBones{
    TargetBone::LeftFoot,
    TargetBone::RightFoot,
    TargetBone::LeftHand,
    TargetBone::RightHand,
    TargetBone::Head,
    TargetBone::Hips,
};

[[nodiscard]] const char* TargetBoneToString(TargetBone bone);

// Effector name on a Mixamo rig, e.g. "LeftFoot"
[[nodiscard]] const char* MixamoName(TargetBone bone);
// "prefix:LeftFoot"
[[nodiscard]] std::string MixamoFullName(TargetBone bone, std::string_view prefix);

// Root to effector, e.g. LeftUpLeg -> LeftLeg -> LeftFoot
[[nodiscard]] const std::vector<std::string>& MixamoChain(TargetBone bone);
[[nodiscard]] std::vector<std::string> MixamoChainWithPrefix(TargetBone bone, std::string_view prefix);
[[nodiscard]] std::size_t ChainLength(TargetBone bone);

// 0 body, 1 left leg, 2 right leg, 3 left arm, 4 right arm, 5 head
[[nodiscard]] std::uint32_t MaskGroup(TargetBone bone);

[[nodiscard]] inline bool IsFoot(TargetBone bone)
{
    return bone == TargetBone::LeftFoot || bone == TargetBone::RightFoot;
}

[[nodiscard]] inline bool IsHand(TargetBone bone)
{
    return bone == TargetBone::LeftHand || bone == TargetBone::RightHand;
}

// Drops a "namespace:" prefix if present
[[nodiscard]] std::string_view StripBonePrefix(std::string_view name);

// Matches scene node names such as "mixamorig12:LeftFoot" or "LeftFoot"
[[nodiscard]] std::optional<TargetBone> TargetBoneFromName(std::string_view name);

} // namespace parkour::targeting
