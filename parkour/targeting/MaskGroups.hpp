#pragma once

#include "parkour/targeting/TargetBone.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parkour::targeting
{

enum class RigType
{
    Mixamo,
    Custom
};

// Bone name -> animation mask group. Masks are bitfields with bit N set for group N.
class MaskGroupConfig
{
public:
    MaskGroupConfig() = default;

    // Registers both bare and "prefix:"-qualified bone names
    [[nodiscard]] static MaskGroupConfig ForMixamo(std::string_view prefix = "mixamorig12");

    void Assign(const std::string& boneName, std::uint32_t group);

    [[nodiscard]] std::optional<std::uint32_t> GroupForBone(const std::string& boneName) const;
    [[nodiscard]] std::vector<std::string> BonesInGroup(std::uint32_t group) const;
    [[nodiscard]] RigType Rig() const { return m_rigType; }

    [[nodiscard]] static std::uint32_t MaskForGroups(const std::vector<std::uint32_t>& groups);
    [[nodiscard]] static std::uint32_t InverseMaskForGroups(const std::vector<std::uint32_t>& groups);
    [[nodiscard]] static std::uint32_t MaskExcludingBone(TargetBone bone);

private:
    std::unordered_map<std::string, std::uint32_t> m_boneToGroup;
    RigType m_rigType = RigType::Custom;
};

} // namespace parkour::targeting
