#pragma once

#include "parkour/animation/BlendingConfig.hpp"

#include <glm/vec3.hpp>

namespace parkour::animation
{

// Stride length and per-foot placement targets from speed and terrain
class StrideCalculator
{
public:
    StrideCalculator() = default;
    StrideCalculator(const StrideSettings& stride, const SpeedThresholds& thresholds)
        : m_stride(stride), m_thresholds(thresholds)
    {
    }

    // Up to walk speed the stride grows from 0 to the walk stride, then towards the run stride
    [[nodiscard]] float StrideLength(float speed, const glm::vec3& terrainNormal) const;

    // Left foot sweeps -0.5..0.5 of the stride, right foot runs half a cycle behind.
    // Feet sit 0.15 m either side of the travel direction.
    [[nodiscard]] glm::vec3 FootTarget(
        const glm::vec3& characterPosition,
        const glm::vec3& velocity,
        float strideLength,
        float footPhase,
        bool leftFoot
    ) const;

    void SetVelocityScale(float scale) { m_velocityScale = scale; }

private:
    StrideSettings m_stride;
    SpeedThresholds m_thresholds;
    float m_velocityScale = 1.0F;
};

// 1 on flat ground, shorter on slopes (never below 0.7)
[[nodiscard]] float SlopeStrideAdjustment(const glm::vec3& terrainNormal);

inline constexpr float kFootLateralOffset = 0.15F;

} // namespace parkour::animation
