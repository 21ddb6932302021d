#include "parkour/animation/MotionClassifier.hpp"

#include <cmath>
#include <iostream>

namespace parkour::animation
{

float HorizontalSpeed(const glm::vec3& velocity)
{
    return std::sqrt(velocity.x * velocity.x + velocity.z * velocity.z);
}

AnimationState MotionClassifier::ClassifySpeed(float speed, const SpeedThresholds& thresholds)
{
    if (speed < thresholds.idleThreshold)
    {
        return AnimationState::Idle();
    }
    if (speed <= thresholds.walkSpeed)
    {
        return AnimationState::Walking();
    }
    return AnimationState::Running(speed);
}

AnimationState MotionClassifier::Classify(const std::optional<std::string>& actionTag, const glm::vec3& velocity)
{
    const BlendingConfig& config = *m_config;

    if (actionTag.has_value())
    {
        if (*actionTag == config.jumpAction)
        {
            return AnimationState::Jumping();
        }

        if (m_reportedTags.size() < kMaxReportedTags && m_reportedTags.insert(*actionTag).second)
        {
            std::cerr << "[Locomotion] Warning: unrecognized action '" << *actionTag << "', falling back to Idle\n";
            if (m_reportedTags.size() == kMaxReportedTags)
            {
                std::cerr << "[Locomotion] Warning: " << kMaxReportedTags
                          << " unrecognized actions reported, further ones are silent\n";
            }
        }
        return AnimationState::Idle();
    }

    return ClassifySpeed(HorizontalSpeed(velocity), config.thresholds);
}

} // namespace parkour::animation
