#pragma once

#include "parkour/physics/PhysicsWorld.hpp"
#include "parkour/scene/Components.hpp"

#include <optional>

#include <glm/vec3.hpp>

namespace parkour::targeting
{

// Length of the probe cast from the character root when measuring ground slope
inline constexpr float kSlopeProbeDistance = 2.0F;

// Finds contact points for feet and hands. Every ray skips the querying character.
class TargetResolver
{
public:
    explicit TargetResolver(const physics::PhysicsWorld& physics)
        : m_physics(&physics)
    {
    }

    // Straight down from the foot; hit point plus `clearance` along the surface normal
    [[nodiscard]] std::optional<glm::vec3> ResolveFootTarget(
        const glm::vec3& footPosition,
        float maxDistance,
        float clearance,
        scene::Entity character
    ) const;

    // Along `facing` from the hand; hit point pushed `offset` out along the wall normal
    [[nodiscard]] std::optional<glm::vec3> ResolveHandTarget(
        const glm::vec3& handPosition,
        const glm::vec3& facing,
        float maxDistance,
        float offset,
        scene::Entity character
    ) const;

    // Degrees between the ground normal under `rootPosition` and world up
    [[nodiscard]] std::optional<float> GroundSlopeAngle(const glm::vec3& rootPosition, scene::Entity character) const;

    // False only when the ground under the root is flatter than `minSlopeAngle`.
    // A zero minimum or a missed probe lets placement run.
    [[nodiscard]] bool PassesSlopeGate(const glm::vec3& rootPosition, float minSlopeAngle, scene::Entity character) const;

private:
    [[nodiscard]] std::optional<physics::RaycastHit> Cast(
        const glm::vec3& origin,
        const glm::vec3& direction,
        float maxDistance,
        scene::Entity character
    ) const;

    const physics::PhysicsWorld* m_physics = nullptr;
};

} // namespace parkour::targeting
