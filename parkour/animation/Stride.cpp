#include "parkour/animation/Stride.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>

namespace parkour::animation
{

namespace
{
glm::vec3 NormalizeOrZero(const glm::vec3& v)
{
    const float length = glm::length(v);
    return length > 1.0e-6F ? v / length : glm::vec3{0.0F};
}
} // namespace

float SlopeStrideAdjustment(const glm::vec3& terrainNormal)
{
    const glm::vec3 normal = NormalizeOrZero(terrainNormal);
    const float slopeFactor = 1.0F - glm::dot(normal, glm::vec3{0.0F, 1.0F, 0.0F});

    if (slopeFactor < 0.01F)
    {
        return 1.0F;
    }
    return std::max(0.7F, 1.0F - slopeFactor * 0.3F);
}

float StrideCalculator::StrideLength(float speed, const glm::vec3& terrainNormal) const
{
    const float clampedSpeed = std::max(0.0F, speed);
    float baseStride = 0.0F;
    if (clampedSpeed < m_thresholds.walkSpeed)
    {
        baseStride = m_stride.walk * std::min(1.0F, clampedSpeed / m_thresholds.walkSpeed);
    }
    else
    {
        const float range = std::max(1.0e-3F, m_thresholds.runSpeed - m_thresholds.walkSpeed);
        const float runFactor = std::min(1.0F, (clampedSpeed - m_thresholds.walkSpeed) / range);
        baseStride = m_stride.walk + (m_stride.run - m_stride.walk) * runFactor;
    }

    return baseStride * m_velocityScale * SlopeStrideAdjustment(terrainNormal);
}

glm::vec3 StrideCalculator::FootTarget(
    const glm::vec3& characterPosition,
    const glm::vec3& velocity,
    float strideLength,
    float footPhase,
    bool leftFoot
) const
{
    const glm::vec3 forward = NormalizeOrZero(velocity);
    const glm::vec3 right = NormalizeOrZero(glm::cross(glm::vec3{0.0F, 1.0F, 0.0F}, forward));

    const float strideOffset = leftFoot ? (footPhase - 0.5F) * strideLength
                                        : (std::fmod(footPhase + 0.5F, 1.0F) - 0.5F) * strideLength;
    const float lateralOffset = leftFoot ? kFootLateralOffset : -kFootLateralOffset;

    return characterPosition + forward * strideOffset + right * lateralOffset;
}

} // namespace parkour::animation
