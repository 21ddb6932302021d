#pragma once

#include "parkour/targeting/TargetBone.hpp"

#include <optional>
#include <string>
#include <utility>

#include <glm/vec3.hpp>

namespace parkour::targeting
{

// Normalized [start, end] slice of the animation during which the bone is matched
struct MatchWindow
{
    float start = 0.0F;
    float end = 0.8F;
};

// Ask for `bone` to reach `targetPosition` within the match window of an
// animation lasting `animationDuration` seconds.
struct TargetMatchRequest
{
    TargetBone bone = TargetBone::Hips;
    glm::vec3 targetPosition{0.0F};
    MatchWindow window;
    float animationDuration = 1.0F;

    // Rejects windows outside 0 <= start < end <= 1 and non-positive durations
    [[nodiscard]] static std::optional<TargetMatchRequest> Create(
        TargetBone bone,
        const glm::vec3& targetPosition,
        float animationDuration,
        MatchWindow window = MatchWindow{},
        std::string* outError = nullptr
    );

    // window * duration, in seconds
    [[nodiscard]] std::pair<float, float> TimeRange() const;
    [[nodiscard]] float MatchDuration() const;

    [[nodiscard]] bool operator==(const TargetMatchRequest& other) const;
    [[nodiscard]] bool operator!=(const TargetMatchRequest& other) const { return !(*this == other); }
};

enum class Easing
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    CubicInOut
};

// 4t^3 below one half, 1 - (-2t + 2)^3 / 2 above
[[nodiscard]] float CubicEaseInOut(float t);
// `t` is clamped to [0, 1]
[[nodiscard]] float ApplyEasing(Easing easing, float t);

enum class MatchPhase
{
    Idle,
    Matching,
    Complete
};

[[nodiscard]] const char* MatchPhaseToString(MatchPhase phase);

// Idle -> Matching{request, startTime} -> Complete{bone}; a new request restarts the cycle
struct TargetMatchingState
{
    MatchPhase phase = MatchPhase::Idle;
    TargetBone bone = TargetBone::Hips;
    std::optional<TargetMatchRequest> request;  // snapshot, set while Matching
    float startTime = 0.0F;
    glm::vec3 startPosition{0.0F};
    float progress = 0.0F;  // eased, [0, 1]

    [[nodiscard]] bool IsMatching() const { return phase == MatchPhase::Matching; }
    [[nodiscard]] const TargetMatchRequest* ActiveRequest() const
    {
        return IsMatching() && request.has_value() ? &*request : nullptr;
    }
};

} // namespace parkour::targeting
