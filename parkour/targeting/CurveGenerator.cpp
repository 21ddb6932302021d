#include "parkour/targeting/CurveGenerator.hpp"

#include <string>
#include <utility>

#include <glm/common.hpp>

namespace parkour::targeting
{

animation::AnimationClip GenerateTargetCurve(
    const TargetMatchRequest& request,
    int jointIndex,
    const glm::vec3& currentPosition,
    Easing easing
)
{
    const std::size_t segments = easing == Easing::Linear ? kLinearCurveSegments : kEasedCurveSegments;
    const auto [startTime, endTime] = request.TimeRange();

    animation::TranslationChannel channel;
    channel.jointIndex = jointIndex;
    channel.times.reserve(segments + 1);
    channel.values.reserve(segments + 1);

    for (std::size_t i = 0; i <= segments; ++i)
    {
        const float t = static_cast<float>(i) / static_cast<float>(segments);
        channel.times.push_back(startTime + t * (endTime - startTime));
        channel.values.push_back(glm::mix(currentPosition, request.targetPosition, ApplyEasing(easing, t)));
    }

    animation::AnimationClip clip;
    clip.name = std::string("match_") + TargetBoneToString(request.bone);
    clip.duration = request.animationDuration;
    clip.translations.push_back(std::move(channel));
    return clip;
}

glm::vec3 CalculateRootOffset(
    const glm::vec3& boneWorldPosition,
    const glm::vec3& targetPosition,
    const glm::vec3& characterRoot
)
{
    const glm::vec3 boneOffsetFromRoot = boneWorldPosition - characterRoot;
    const glm::vec3 requiredRoot = targetPosition - boneOffsetFromRoot;
    return requiredRoot - characterRoot;
}

} // namespace parkour::targeting
