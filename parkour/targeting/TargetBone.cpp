#include "parkour/targeting/TargetBone.hpp"

namespace parkour::targeting
{

const char* TargetBoneToString(TargetBone bone)
{
    return MixamoName(bone);
}

const char* MixamoName(TargetBone bone)
{
    switch (bone)
    {
        case TargetBone::LeftFoot: return "LeftFoot";
        case TargetBone::RightFoot: return "RightFoot";
        case TargetBone::LeftHand: return "LeftHand";
        case TargetBone::RightHand: return "RightHand";
        case TargetBone::Head: return "Head";
        case TargetBone::Hips: return "Hips";
        default: return "Hips";
    }
}

std::string MixamoFullName(TargetBone bone, std::string_view prefix)
{
    return std::string{prefix} + ":" + MixamoName(bone);
}

const std::vector<std::string>& MixamoChain(TargetBone bone)
{
    static const std::vector<std::string> kLeftLeg{"LeftUpLeg", "LeftLeg", "LeftFoot"};
    static const std::vector<std::string> kRightLeg{"RightUpLeg", "RightLeg", "RightFoot"};
    static const std::vector<std::string> kLeftArm{"LeftArm", "LeftForeArm", "LeftHand"};
    static const std::vector<std::string> kRightArm{"RightArm", "RightForeArm", "RightHand"};
    static const std::vector<std::string> kHead{"Neck", "Head"};
    static const std::vector<std::string> kHips{"Hips"};

    switch (bone)
    {
        case TargetBone::LeftFoot: return kLeftLeg;
        case TargetBone::RightFoot: return kRightLeg;
        case TargetBone::LeftHand: return kLeftArm;
        case TargetBone::RightHand: return kRightArm;
        case TargetBone::Head: return kHead;
        case TargetBone::Hips:
        default:
            return kHips;
    }
}

std::vector<std::string> MixamoChainWithPrefix(TargetBone bone, std::string_view prefix)
{
    std::vector<std::string> names;
    for (const std::string& name : MixamoChain(bone))
    {
        names.push_back(std::string{prefix} + ":" + name);
    }
    return names;
}

std::size_t ChainLength(TargetBone bone)
{
    return MixamoChain(bone).size();
}

std::uint32_t MaskGroup(TargetBone bone)
{
    switch (bone)
    {
        case TargetBone::LeftFoot: return 1;
        case TargetBone::RightFoot: return 2;
        case TargetBone::LeftHand: return 3;
        case TargetBone::RightHand: return 4;
        case TargetBone::Head: return 5;
        case TargetBone::Hips:
        default:
            return 0;
    }
}

std::string_view StripBonePrefix(std::string_view name)
{
    const std::size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::optional<TargetBone> TargetBoneFromName(std::string_view name)
{
    const std::string_view boneName = StripBonePrefix(name);
    for (const TargetBone bone : kAllTargetBones)
    {
        if (boneName == MixamoName(bone))
        {
            return bone;
        }
    }
    return std::nullopt;
}

} // namespace parkour::targeting
