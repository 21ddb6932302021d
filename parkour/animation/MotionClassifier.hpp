#pragma once

#include "parkour/animation/AnimationState.hpp"
#include "parkour/animation/BlendingConfig.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>

#include <glm/vec3.hpp>

namespace parkour::animation
{

// Length of the velocity projected onto the XZ plane
[[nodiscard]] float HorizontalSpeed(const glm::vec3& velocity);

// Maps a character's action tag and velocity to exactly one AnimationState.
// One classifier per character: unknown tags are reported once each, up to
// kMaxReportedTags distinct tags; later ones are still classified but not reported.
class MotionClassifier
{
public:
    static constexpr std::size_t kMaxReportedTags = 32;

    explicit MotionClassifier(const BlendingConfig& config) : m_config(&config) {}

    [[nodiscard]] AnimationState Classify(const std::optional<std::string>& actionTag, const glm::vec3& velocity);

    // Speed-only path used when no action is active
    [[nodiscard]] static AnimationState ClassifySpeed(float speed, const SpeedThresholds& thresholds);

    [[nodiscard]] std::size_t ReportedTagCount() const { return m_reportedTags.size(); }

private:
    const BlendingConfig* m_config;
    std::unordered_set<std::string> m_reportedTags;
};

} // namespace parkour::animation
