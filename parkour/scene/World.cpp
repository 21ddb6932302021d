#include "parkour/scene/World.hpp"

#include <algorithm>

#include <glm/common.hpp>

namespace parkour::scene
{
namespace
{
const std::vector<Entity> kNoChildren;
} // namespace

Entity World::CreateEntity()
{
    return m_nextEntity++;
}

Entity World::CreateNamedEntity(const std::string& name, Entity parent, const Transform& local)
{
    const Entity entity = CreateEntity();
    m_transforms[entity] = local;
    m_names[entity] = NameComponent{name};
    m_hierarchy[entity];
    if (parent != kNullEntity)
    {
        SetParent(entity, parent);
    }
    return entity;
}

void World::DestroyEntity(Entity entity)
{
    // Children go first so the parent's child list is still intact while walking it
    const auto hierarchyIt = m_hierarchy.find(entity);
    if (hierarchyIt != m_hierarchy.end())
    {
        const std::vector<Entity> children = hierarchyIt->second.children;
        for (const Entity child : children)
        {
            DestroyEntity(child);
        }
        SetParent(entity, kNullEntity);
    }

    m_transforms.erase(entity);
    m_hierarchy.erase(entity);
    m_names.erase(entity);
    m_motions.erase(entity);
    m_ikConstraints.erase(entity);
    m_ikTargetProxies.erase(entity);
}

void World::Clear()
{
    m_nextEntity = 1;
    m_transforms.clear();
    m_hierarchy.clear();
    m_names.clear();
    m_motions.clear();
    m_ikConstraints.clear();
    m_ikTargetProxies.clear();
}

bool World::HasEntity(Entity entity) const
{
    return m_transforms.contains(entity) || m_hierarchy.contains(entity) || m_names.contains(entity) ||
           m_motions.contains(entity) || m_ikConstraints.contains(entity) || m_ikTargetProxies.contains(entity);
}

void World::SetParent(Entity child, Entity parent)
{
    if (child == kNullEntity || child == parent)
    {
        return;
    }

    HierarchyComponent& childNode = m_hierarchy[child];
    if (childNode.parent != kNullEntity)
    {
        const auto oldParentIt = m_hierarchy.find(childNode.parent);
        if (oldParentIt != m_hierarchy.end())
        {
            auto& siblings = oldParentIt->second.children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), child), siblings.end());
        }
    }

    childNode.parent = parent;
    if (parent != kNullEntity)
    {
        m_hierarchy[parent].children.push_back(child);
    }
}

Entity World::ParentOf(Entity entity) const
{
    const auto it = m_hierarchy.find(entity);
    return it != m_hierarchy.end() ? it->second.parent : kNullEntity;
}

const std::vector<Entity>& World::ChildrenOf(Entity entity) const
{
    const auto it = m_hierarchy.find(entity);
    return it != m_hierarchy.end() ? it->second.children : kNoChildren;
}

void World::VisitDescendants(Entity root, const std::function<void(Entity)>& visitor) const
{
    std::vector<Entity> toVisit{root};
    while (!toVisit.empty())
    {
        const Entity entity = toVisit.back();
        toVisit.pop_back();
        visitor(entity);

        const std::vector<Entity>& children = ChildrenOf(entity);
        toVisit.insert(toVisit.end(), children.begin(), children.end());
    }
}

GlobalTransform World::ComputeGlobalTransform(Entity entity) const
{
    GlobalTransform result;

    // Collect the chain root-last, then compose from the root down
    std::vector<const Transform*> chain;
    Entity current = entity;
    while (current != kNullEntity)
    {
        const auto it = m_transforms.find(current);
        if (it != m_transforms.end())
        {
            chain.push_back(&it->second);
        }
        current = ParentOf(current);
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        const Transform& local = **it;
        result.position = result.position + result.rotation * (result.scale * local.position);
        result.rotation = glm::normalize(result.rotation * local.rotation);
        result.scale = result.scale * local.scale;
    }

    return result;
}

void World::SetWorldPosition(Entity entity, const glm::vec3& worldPosition)
{
    Transform& local = m_transforms[entity];
    const Entity parent = ParentOf(entity);
    if (parent == kNullEntity)
    {
        local.position = worldPosition;
        return;
    }

    const GlobalTransform parentGlobal = ComputeGlobalTransform(parent);
    const glm::vec3 relative = glm::inverse(parentGlobal.rotation) * (worldPosition - parentGlobal.position);
    local.position = relative / glm::max(parentGlobal.scale, glm::vec3{1.0e-6F});
}

const std::string* World::NameOf(Entity entity) const
{
    const auto it = m_names.find(entity);
    return it != m_names.end() ? &it->second.name : nullptr;
}

} // namespace parkour::scene
