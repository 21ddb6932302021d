#include "parkour/animation/AnimationClip.hpp"

#include <algorithm>
#include <cmath>

namespace parkour::animation
{

namespace
{
// Index of the keyframe at or before `time`, clamped so idx + 1 stays valid
std::size_t FindKeyframeIndex(const std::vector<float>& times, float time)
{
    if (times.size() < 2)
    {
        return 0;
    }

    auto it = std::upper_bound(times.begin(), times.end(), time);
    if (it == times.begin())
    {
        return 0;
    }
    if (it == times.end())
    {
        return times.size() - 1;
    }
    return static_cast<std::size_t>(std::distance(times.begin(), it) - 1);
}

glm::vec3 LerpVec3(const glm::vec3& a, const glm::vec3& b, float t)
{
    return a + (b - a) * t;
}

float ComputeAlpha(float time, float t0, float t1)
{
    if (t1 <= t0)
    {
        return 0.0F;
    }
    return std::clamp((time - t0) / (t1 - t0), 0.0F, 1.0F);
}

template <typename Channel>
const Channel* FindChannel(const std::vector<Channel>& channels, int jointIndex)
{
    for (const auto& ch : channels)
    {
        if (ch.jointIndex == jointIndex && !ch.Empty())
        {
            return &ch;
        }
    }
    return nullptr;
}
} // namespace

glm::quat SlerpShortest(const glm::quat& a, const glm::quat& b, float t)
{
    const glm::quat target = glm::dot(a, b) < 0.0F ? -b : b;
    return glm::normalize(glm::slerp(a, target, t));
}

bool AnimationClip::HasTranslation(int jointIndex) const
{
    return FindTranslation(jointIndex) != nullptr;
}

bool AnimationClip::HasRotation(int jointIndex) const
{
    return FindRotation(jointIndex) != nullptr;
}

bool AnimationClip::HasScale(int jointIndex) const
{
    return FindScale(jointIndex) != nullptr;
}

std::vector<int> AnimationClip::AnimatedJoints() const
{
    std::vector<int> joints;
    joints.reserve(translations.size() + rotations.size() + scales.size());
    for (const auto& ch : translations)
    {
        joints.push_back(ch.jointIndex);
    }
    for (const auto& ch : rotations)
    {
        joints.push_back(ch.jointIndex);
    }
    for (const auto& ch : scales)
    {
        joints.push_back(ch.jointIndex);
    }
    std::sort(joints.begin(), joints.end());
    joints.erase(std::unique(joints.begin(), joints.end()), joints.end());
    return joints;
}

const TranslationChannel* AnimationClip::FindTranslation(int jointIndex) const
{
    return FindChannel(translations, jointIndex);
}

const RotationChannel* AnimationClip::FindRotation(int jointIndex) const
{
    return FindChannel(rotations, jointIndex);
}

const ScaleChannel* AnimationClip::FindScale(int jointIndex) const
{
    return FindChannel(scales, jointIndex);
}

template <typename T, typename InterpFunc>
void AnimationClip::SampleChannel(const AnimationChannel<T>& channel, float time, T& out, InterpFunc interp)
{
    if (channel.Empty())
    {
        return;
    }

    const std::size_t keyCount = std::min(channel.times.size(), channel.values.size());
    const std::size_t idx = std::min(FindKeyframeIndex(channel.times, time), keyCount - 1);

    if (idx + 1 >= keyCount)
    {
        out = channel.values[keyCount - 1];
        return;
    }

    const float alpha = ComputeAlpha(time, channel.times[idx], channel.times[idx + 1]);
    out = interp(channel.values[idx], channel.values[idx + 1], alpha);
}

void AnimationClip::SampleTranslation(int jointIndex, float time, glm::vec3& out) const
{
    const TranslationChannel* ch = FindTranslation(jointIndex);
    if (ch != nullptr)
    {
        SampleChannel(*ch, time, out, LerpVec3);
    }
}

void AnimationClip::SampleRotation(int jointIndex, float time, glm::quat& out) const
{
    const RotationChannel* ch = FindRotation(jointIndex);
    if (ch != nullptr)
    {
        SampleChannel(*ch, time, out, SlerpShortest);
    }
}

void AnimationClip::SampleScale(int jointIndex, float time, glm::vec3& out) const
{
    const ScaleChannel* ch = FindScale(jointIndex);
    if (ch != nullptr)
    {
        SampleChannel(*ch, time, out, LerpVec3);
    }
}

} // namespace parkour::animation
