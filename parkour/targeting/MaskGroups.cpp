#include "parkour/targeting/MaskGroups.hpp"

#include <algorithm>
#include <initializer_list>

namespace parkour::targeting
{

MaskGroupConfig MaskGroupConfig::ForMixamo(std::string_view prefix)
{
    MaskGroupConfig config;
    config.m_rigType = RigType::Mixamo;

    const auto addBones = [&config, prefix](std::initializer_list<const char*> bones, std::uint32_t group) {
        for (const char* bone : bones)
        {
            config.Assign(bone, group);
            config.Assign(std::string{prefix} + ":" + bone, group);
        }
    };

    addBones({"Hips", "Spine", "Spine1", "Spine2", "Neck", "Head", "HeadTop_End", "LeftShoulder", "RightShoulder"}, 0);
    addBones({"LeftUpLeg", "LeftLeg", "LeftFoot", "LeftToeBase", "LeftToe_End"}, 1);
    addBones({"RightUpLeg", "RightLeg", "RightFoot", "RightToeBase", "RightToe_End"}, 2);
    addBones({"LeftArm", "LeftForeArm", "LeftHand"}, 3);
    addBones({"RightArm", "RightForeArm", "RightHand"}, 4);
    // Head moves out of the body group into its own
    addBones({"Head"}, 5);

    return config;
}

void MaskGroupConfig::Assign(const std::string& boneName, std::uint32_t group)
{
    m_boneToGroup[boneName] = group;
}

std::optional<std::uint32_t> MaskGroupConfig::GroupForBone(const std::string& boneName) const
{
    const auto it = m_boneToGroup.find(boneName);
    if (it == m_boneToGroup.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MaskGroupConfig::BonesInGroup(std::uint32_t group) const
{
    std::vector<std::string> bones;
    for (const auto& [name, boneGroup] : m_boneToGroup)
    {
        if (boneGroup == group)
        {
            bones.push_back(name);
        }
    }
    std::sort(bones.begin(), bones.end());
    return bones;
}

std::uint32_t MaskGroupConfig::MaskForGroups(const std::vector<std::uint32_t>& groups)
{
    std::uint32_t mask = 0;
    for (const std::uint32_t group : groups)
    {
        if (group < 32)
        {
            mask |= 1U << group;
        }
    }
    return mask;
}

std::uint32_t MaskGroupConfig::InverseMaskForGroups(const std::vector<std::uint32_t>& groups)
{
    return ~MaskForGroups(groups);
}

std::uint32_t MaskGroupConfig::MaskExcludingBone(TargetBone bone)
{
    return InverseMaskForGroups({MaskGroup(bone)});
}

} // namespace parkour::targeting
