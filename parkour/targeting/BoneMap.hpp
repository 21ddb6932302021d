#pragma once

#include "parkour/scene/World.hpp"
#include "parkour/targeting/TargetBone.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace parkour::targeting
{

// TargetBone -> bone entity of one character. Indexes entities owned by the World.
class BoneMap
{
public:
    [[nodiscard]] std::optional<scene::Entity> Get(TargetBone bone) const;
    void Insert(TargetBone bone, scene::Entity entity) { m_bones[bone] = entity; }
    void Clear() { m_bones.clear(); }

    [[nodiscard]] bool Empty() const { return m_bones.empty(); }
    [[nodiscard]] std::size_t Size() const { return m_bones.size(); }
    [[nodiscard]] std::size_t Attempts() const { return m_attempts; }

    // Walks `root` and all of its descendants matching node names. Returns bones found.
    std::size_t Build(const scene::World& world, scene::Entity root);

    // Builds while the map is still empty (the skeleton may stream in later).
    // Returns true once the map holds at least one bone.
    bool EnsureBuilt(const scene::World& world, scene::Entity root, bool verbose = false);

private:
    std::unordered_map<TargetBone, scene::Entity> m_bones;
    std::size_t m_attempts = 0;
};

} // namespace parkour::targeting
