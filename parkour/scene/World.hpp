#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "parkour/scene/Components.hpp"

namespace parkour::scene
{
class World
{
public:
    Entity CreateEntity();
    Entity CreateNamedEntity(const std::string& name, Entity parent = kNullEntity, const Transform& local = Transform{});
    void DestroyEntity(Entity entity);
    void Clear();

    [[nodiscard]] bool HasEntity(Entity entity) const;

    // Re-parents `child` under `parent` (kNullEntity detaches it)
    void SetParent(Entity child, Entity parent);
    [[nodiscard]] Entity ParentOf(Entity entity) const;
    [[nodiscard]] const std::vector<Entity>& ChildrenOf(Entity entity) const;

    // Depth-first walk over `root` and all of its descendants
    void VisitDescendants(Entity root, const std::function<void(Entity)>& visitor) const;

    [[nodiscard]] GlobalTransform ComputeGlobalTransform(Entity entity) const;
    // Sets the local transform so the entity ends up at `worldPosition`
    void SetWorldPosition(Entity entity, const glm::vec3& worldPosition);

    [[nodiscard]] const std::string* NameOf(Entity entity) const;

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, HierarchyComponent>& Hierarchy() { return m_hierarchy; }
    std::unordered_map<Entity, NameComponent>& Names() { return m_names; }
    std::unordered_map<Entity, CharacterMotionComponent>& Motions() { return m_motions; }
    std::unordered_map<Entity, IkConstraintComponent>& IkConstraints() { return m_ikConstraints; }
    std::unordered_map<Entity, IkTargetProxyComponent>& IkTargetProxies() { return m_ikTargetProxies; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, HierarchyComponent>& Hierarchy() const { return m_hierarchy; }
    [[nodiscard]] const std::unordered_map<Entity, NameComponent>& Names() const { return m_names; }
    [[nodiscard]] const std::unordered_map<Entity, CharacterMotionComponent>& Motions() const { return m_motions; }
    [[nodiscard]] const std::unordered_map<Entity, IkConstraintComponent>& IkConstraints() const { return m_ikConstraints; }
    [[nodiscard]] const std::unordered_map<Entity, IkTargetProxyComponent>& IkTargetProxies() const { return m_ikTargetProxies; }

private:
    Entity m_nextEntity = 1;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, HierarchyComponent> m_hierarchy;
    std::unordered_map<Entity, NameComponent> m_names;
    std::unordered_map<Entity, CharacterMotionComponent> m_motions;
    std::unordered_map<Entity, IkConstraintComponent> m_ikConstraints;
    std::unordered_map<Entity, IkTargetProxyComponent> m_ikTargetProxies;
};
} // namespace parkour::scene
