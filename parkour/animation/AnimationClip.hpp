#pragma once

#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

namespace parkour::animation
{

// Animation channel for a single joint property (translation, rotation, or scale)
template <typename T>
struct AnimationChannel
{
    int jointIndex = -1;           // Index into the source node list
    std::vector<float> times;       // Keyframe timestamps, ascending
    std::vector<T> values;          // Keyframe values

    [[nodiscard]] bool Empty() const { return times.empty() || values.empty(); }
    [[nodiscard]] std::size_t KeyCount() const { return times.size(); }
};

using TranslationChannel = AnimationChannel<glm::vec3>;
using RotationChannel = AnimationChannel<glm::quat>;
using ScaleChannel = AnimationChannel<glm::vec3>;

// A keyframed clip, either imported from glTF or generated procedurally
struct AnimationClip
{
    std::string name;
    float duration = 0.0F;

    std::vector<TranslationChannel> translations;
    std::vector<RotationChannel> rotations;
    std::vector<ScaleChannel> scales;

    [[nodiscard]] bool Valid() const { return !name.empty() && duration > 0.0F; }
    [[nodiscard]] bool HasTranslation(int jointIndex) const;
    [[nodiscard]] bool HasRotation(int jointIndex) const;
    [[nodiscard]] bool HasScale(int jointIndex) const;

    // Sorted, de-duplicated list of every joint touched by any channel
    [[nodiscard]] std::vector<int> AnimatedJoints() const;

    // Sample at a specific time (leaves `out` untouched if no channel)
    void SampleTranslation(int jointIndex, float time, glm::vec3& out) const;
    void SampleRotation(int jointIndex, float time, glm::quat& out) const;
    void SampleScale(int jointIndex, float time, glm::vec3& out) const;

private:
    [[nodiscard]] const TranslationChannel* FindTranslation(int jointIndex) const;
    [[nodiscard]] const RotationChannel* FindRotation(int jointIndex) const;
    [[nodiscard]] const ScaleChannel* FindScale(int jointIndex) const;

    template <typename T, typename InterpFunc>
    static void SampleChannel(const AnimationChannel<T>& channel, float time, T& out, InterpFunc interp);
};

// Shortest-arc spherical interpolation
[[nodiscard]] glm::quat SlerpShortest(const glm::quat& a, const glm::quat& b, float t);

} // namespace parkour::animation
