#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

namespace parkour::scene
{
using Entity = std::uint32_t;

constexpr Entity kNullEntity = 0;

// Local transform relative to the parent entity (world space for roots)
struct Transform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F, 1.0F, 1.0F};
};

// Resolved world-space transform
struct GlobalTransform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F, 1.0F, 1.0F};

    [[nodiscard]] glm::vec3 Forward() const { return rotation * glm::vec3{0.0F, 0.0F, -1.0F}; }
};

struct HierarchyComponent
{
    Entity parent = kNullEntity;
    std::vector<Entity> children;
};

struct NameComponent
{
    std::string name;
};

// Per-frame kinematic snapshot written by the character controller
struct CharacterMotionComponent
{
    std::optional<std::string> actionTag;
    glm::vec3 velocity{0.0F, 0.0F, 0.0F};
    glm::vec3 groundNormal{0.0F, 1.0F, 0.0F};
    bool grounded = true;
    bool basisReady = false;  // false until the controller has fed its first basis
};

// Consumed by an external IK solver; attached to the effector bone
struct IkConstraintComponent
{
    std::size_t chainLength = 1;
    std::uint32_t iterations = 20;
    Entity target = kNullEntity;
    Entity poleTarget = kNullEntity;
    float poleAngle = 0.0F;
    bool enabled = true;
};

// Marks a spawned IK target or pole target so it can be found and reused
struct IkTargetProxyComponent
{
    Entity owner = kNullEntity;
    Entity bone = kNullEntity;
    bool pole = false;
};
} // namespace parkour::scene
