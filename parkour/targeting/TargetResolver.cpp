#include "parkour/targeting/TargetResolver.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace parkour::targeting
{

std::optional<physics::RaycastHit> TargetResolver::Cast(
    const glm::vec3& origin,
    const glm::vec3& direction,
    float maxDistance,
    scene::Entity character
) const
{
    if (m_physics == nullptr || !(maxDistance > 0.0F) || glm::length(direction) < 1.0e-6F)
    {
        return std::nullopt;
    }

    physics::EntityFilter exclude;
    if (character != scene::kNullEntity)
    {
        exclude.insert(character);
    }
    return m_physics->CastRay(origin, direction, maxDistance, exclude);
}

std::optional<glm::vec3> TargetResolver::ResolveFootTarget(
    const glm::vec3& footPosition,
    float maxDistance,
    float clearance,
    scene::Entity character
) const
{
    const std::optional<physics::RaycastHit> hit = Cast(footPosition, glm::vec3{0.0F, -1.0F, 0.0F}, maxDistance, character);
    if (!hit.has_value())
    {
        return std::nullopt;
    }
    return hit->position + glm::normalize(hit->normal) * clearance;
}

std::optional<glm::vec3> TargetResolver::ResolveHandTarget(
    const glm::vec3& handPosition,
    const glm::vec3& facing,
    float maxDistance,
    float offset,
    scene::Entity character
) const
{
    const std::optional<physics::RaycastHit> hit = Cast(handPosition, facing, maxDistance, character);
    if (!hit.has_value())
    {
        return std::nullopt;
    }
    return hit->position + glm::normalize(hit->normal) * offset;
}

std::optional<float> TargetResolver::GroundSlopeAngle(const glm::vec3& rootPosition, scene::Entity character) const
{
    const std::optional<physics::RaycastHit> hit =
        Cast(rootPosition, glm::vec3{0.0F, -1.0F, 0.0F}, kSlopeProbeDistance, character);
    if (!hit.has_value())
    {
        return std::nullopt;
    }

    const glm::vec3 normal = glm::normalize(hit->normal);
    const float cosine = std::clamp(glm::dot(normal, glm::vec3{0.0F, 1.0F, 0.0F}), -1.0F, 1.0F);
    return glm::degrees(std::acos(cosine));
}

bool TargetResolver::PassesSlopeGate(const glm::vec3& rootPosition, float minSlopeAngle, scene::Entity character) const
{
    if (!(minSlopeAngle > 0.0F))
    {
        return true;
    }
    const std::optional<float> angle = GroundSlopeAngle(rootPosition, character);
    if (!angle.has_value())
    {
        return true;
    }
    return *angle >= minSlopeAngle;
}

} // namespace parkour::targeting
