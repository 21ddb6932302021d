#pragma once

#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/scene/World.hpp"
#include "parkour/targeting/BoneMap.hpp"
#include "parkour/targeting/TargetMatcher.hpp"
#include "parkour/targeting/TargetResolver.hpp"

#include <cstddef>

namespace parkour::targeting
{

// Advances `accumulator` by `deltaSeconds`; true once per elapsed `interval`
bool TickCadence(float& accumulator, float interval, float deltaSeconds);

// Probes ground under the feet and walls in front of the hands on a fixed
// cadence, turning hits into target match requests.
class PlacementSystem
{
public:
    explicit PlacementSystem(const animation::BlendingConfig& config)
        : m_config(&config)
    {
    }

    // Returns the number of requests submitted this tick
    std::size_t UpdateFeet(
        const scene::World& world,
        const TargetResolver& resolver,
        const BoneMap& boneMap,
        scene::Entity character,
        float deltaSeconds,
        float& timer,
        TargetMatcher& matcher
    ) const;

    std::size_t UpdateHands(
        const scene::World& world,
        const TargetResolver& resolver,
        const BoneMap& boneMap,
        scene::Entity character,
        float deltaSeconds,
        float& timer,
        TargetMatcher& matcher
    ) const;

private:
    bool SubmitRequest(TargetMatcher& matcher, TargetBone bone, const glm::vec3& target, float duration, const char* tag) const;

    const animation::BlendingConfig* m_config = nullptr;
};

} // namespace parkour::targeting
