#include "parkour/targeting/TargetMatching.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace parkour::targeting
{

std::optional<TargetMatchRequest> TargetMatchRequest::Create(
    TargetBone bone,
    const glm::vec3& targetPosition,
    float animationDuration,
    MatchWindow window,
    std::string* outError
)
{
    if (!(window.start >= 0.0F && window.start < window.end && window.end <= 1.0F))
    {
        if (outError != nullptr)
        {
            std::ostringstream message;
            message << "Match window must satisfy 0 <= start < end <= 1 (got " << window.start << ", " << window.end
                    << ")";
            *outError = message.str();
        }
        return std::nullopt;
    }
    if (!(animationDuration > 0.0F) || !std::isfinite(animationDuration))
    {
        if (outError != nullptr)
        {
            *outError = "Animation duration must be > 0";
        }
        return std::nullopt;
    }

    TargetMatchRequest request;
    request.bone = bone;
    request.targetPosition = targetPosition;
    request.window = window;
    request.animationDuration = animationDuration;
    return request;
}

std::pair<float, float> TargetMatchRequest::TimeRange() const
{
    return {window.start * animationDuration, window.end * animationDuration};
}

float TargetMatchRequest::MatchDuration() const
{
    const auto [start, end] = TimeRange();
    return end - start;
}

bool TargetMatchRequest::operator==(const TargetMatchRequest& other) const
{
    return bone == other.bone && targetPosition == other.targetPosition && window.start == other.window.start &&
           window.end == other.window.end && animationDuration == other.animationDuration;
}

float CubicEaseInOut(float t)
{
    if (t < 0.5F)
    {
        return 4.0F * t * t * t;
    }
    const float u = -2.0F * t + 2.0F;
    return 1.0F - (u * u * u) / 2.0F;
}

float ApplyEasing(Easing easing, float t)
{
    t = std::clamp(t, 0.0F, 1.0F);
    switch (easing)
    {
        case Easing::EaseIn: return t * t;
        case Easing::EaseOut:
        {
            const float u = 1.0F - t;
            return 1.0F - u * u;
        }
        case Easing::EaseInOut:
        {
            if (t < 0.5F)
            {
                return 2.0F * t * t;
            }
            const float u = 2.0F * t - 1.0F;
            return -0.5F * (u * (u - 2.0F) - 1.0F);
        }
        case Easing::CubicInOut: return CubicEaseInOut(t);
        case Easing::Linear:
        default:
            return t;
    }
}

const char* MatchPhaseToString(MatchPhase phase)
{
    switch (phase)
    {
        case MatchPhase::Idle: return "Idle";
        case MatchPhase::Matching: return "Matching";
        case MatchPhase::Complete: return "Complete";
        default: return "Idle";
    }
}

} // namespace parkour::targeting
