#include "parkour/targeting/PlacementSystems.hpp"

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>

#include <glm/geometric.hpp>

namespace parkour::targeting
{

bool TickCadence(float& accumulator, float interval, float deltaSeconds)
{
    if (!(interval > 0.0F))
    {
        return false;
    }
    accumulator += deltaSeconds;
    if (accumulator < interval)
    {
        return false;
    }
    accumulator = std::fmod(accumulator, interval);
    return true;
}

bool PlacementSystem::SubmitRequest(
    TargetMatcher& matcher,
    TargetBone bone,
    const glm::vec3& target,
    float duration,
    const char* tag
) const
{
    std::string error;
    const MatchWindow window{m_config->targetMatching.windowStart, m_config->targetMatching.windowEnd};
    const std::optional<TargetMatchRequest> request = TargetMatchRequest::Create(bone, target, duration, window, &error);
    if (!request.has_value())
    {
        std::cerr << tag << " Warning: rejected request for " << TargetBoneToString(bone) << ": " << error << "\n";
        return false;
    }
    matcher.Submit(*request);
    return true;
}

std::size_t PlacementSystem::UpdateFeet(
    const scene::World& world,
    const TargetResolver& resolver,
    const BoneMap& boneMap,
    scene::Entity character,
    float deltaSeconds,
    float& timer,
    TargetMatcher& matcher
) const
{
    const FootPlacementSettings& settings = m_config->footPlacement;
    if (!settings.enabled || !TickCadence(timer, settings.updateInterval, deltaSeconds))
    {
        return 0;
    }
    if (boneMap.Empty())
    {
        if (m_config->verboseTrace)
        {
            std::cout << "[FootPlacement] Bone map for entity " << character << " is empty\n";
        }
        return 0;
    }

    const glm::vec3 rootPosition = world.ComputeGlobalTransform(character).position;
    if (!resolver.PassesSlopeGate(rootPosition, settings.minSlopeAngle, character))
    {
        return 0;
    }

    std::size_t submitted = 0;
    for (const TargetBone bone : {TargetBone::LeftFoot, TargetBone::RightFoot})
    {
        const std::optional<scene::Entity> foot = boneMap.Get(bone);
        if (!foot.has_value())
        {
            if (m_config->verboseTrace)
            {
                std::cout << "[FootPlacement] " << TargetBoneToString(bone) << " not in bone map\n";
            }
            continue;
        }

        const glm::vec3 footPosition = world.ComputeGlobalTransform(*foot).position;
        const std::optional<glm::vec3> target =
            resolver.ResolveFootTarget(footPosition, settings.raycastDistance, settings.footOffset, character);
        if (!target.has_value())
        {
            if (m_config->verboseTrace)
            {
                std::cout << "[FootPlacement] " << TargetBoneToString(bone) << " ray missed ground\n";
            }
            continue;
        }

        if (SubmitRequest(matcher, bone, *target, settings.updateInterval, "[FootPlacement]"))
        {
            ++submitted;
        }
    }
    return submitted;
}

std::size_t PlacementSystem::UpdateHands(
    const scene::World& world,
    const TargetResolver& resolver,
    const BoneMap& boneMap,
    scene::Entity character,
    float deltaSeconds,
    float& timer,
    TargetMatcher& matcher
) const
{
    const HandPlacementSettings& settings = m_config->handPlacement;
    if (!settings.enabled || !TickCadence(timer, settings.updateInterval, deltaSeconds))
    {
        return 0;
    }
    if (boneMap.Empty())
    {
        return 0;
    }

    const glm::vec3 facing = world.ComputeGlobalTransform(character).Forward();
    if (glm::length(facing) < 1.0e-6F)
    {
        return 0;
    }

    std::size_t submitted = 0;
    for (const TargetBone bone : {TargetBone::LeftHand, TargetBone::RightHand})
    {
        const std::optional<scene::Entity> hand = boneMap.Get(bone);
        if (!hand.has_value())
        {
            continue;
        }

        const glm::vec3 handPosition = world.ComputeGlobalTransform(*hand).position;
        const std::optional<glm::vec3> target =
            resolver.ResolveHandTarget(handPosition, facing, settings.raycastDistance, settings.handOffset, character);
        if (!target.has_value())
        {
            continue;
        }

        if (SubmitRequest(matcher, bone, *target, settings.matchDuration, "[HandPlacement]"))
        {
            if (m_config->verboseTrace)
            {
                std::cout << "[HandPlacement] " << TargetBoneToString(bone) << " reaching wall\n";
            }
            ++submitted;
        }
    }
    return submitted;
}

} // namespace parkour::targeting
