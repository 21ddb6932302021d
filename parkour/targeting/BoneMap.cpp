#include "parkour/targeting/BoneMap.hpp"

#include <iostream>

namespace parkour::targeting
{

std::optional<scene::Entity> BoneMap::Get(TargetBone bone) const
{
    const auto it = m_bones.find(bone);
    if (it == m_bones.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t BoneMap::Build(const scene::World& world, scene::Entity root)
{
    std::size_t found = 0;
    world.VisitDescendants(root, [this, &world, &found](scene::Entity entity) {
        const std::string* name = world.NameOf(entity);
        if (name == nullptr)
        {
            return;
        }
        const std::optional<TargetBone> bone = TargetBoneFromName(*name);
        if (bone.has_value())
        {
            m_bones[*bone] = entity;
            ++found;
        }
    });
    return found;
}

bool BoneMap::EnsureBuilt(const scene::World& world, scene::Entity root, bool verbose)
{
    if (!Empty())
    {
        return true;
    }

    ++m_attempts;
    const std::size_t found = Build(world, root);
    if (found > 0)
    {
        std::cout << "[BoneMap] Built bone map for entity " << root << " with " << found << " bones";
        if (m_attempts > 1)
        {
            std::cout << " (attempt " << m_attempts << ")";
        }
        std::cout << "\n";
        return true;
    }

    if (m_attempts == 1)
    {
        std::cerr << "[BoneMap] Warning: no bones found under entity " << root
                  << ", will retry while the skeleton loads\n";
    }
    else if (verbose)
    {
        std::cout << "[BoneMap] Retry " << m_attempts << " for entity " << root << " found nothing\n";
    }
    return false;
}

} // namespace parkour::targeting
