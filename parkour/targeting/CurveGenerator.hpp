#pragma once

#include "parkour/animation/AnimationClip.hpp"
#include "parkour/targeting/TargetMatching.hpp"

#include <cstddef>

#include <glm/vec3.hpp>

namespace parkour::targeting
{

inline constexpr std::size_t kLinearCurveSegments = 5;
inline constexpr std::size_t kEasedCurveSegments = 8;

// Translation-only clip moving joint `jointIndex` from `currentPosition` to the
// request target over the request's time range. Linear uses 5 segments, the
// eased variants 8 (N + 1 keyframes).
[[nodiscard]] animation::AnimationClip GenerateTargetCurve(
    const TargetMatchRequest& request,
    int jointIndex,
    const glm::vec3& currentPosition,
    Easing easing = Easing::Linear
);

// Offset to apply to the character root so that the bone lands on the target
[[nodiscard]] glm::vec3 CalculateRootOffset(
    const glm::vec3& boneWorldPosition,
    const glm::vec3& targetPosition,
    const glm::vec3& characterRoot
);

} // namespace parkour::targeting
