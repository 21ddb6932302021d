#include "parkour/targeting/TargetMatcher.hpp"

#include "parkour/targeting/CurveGenerator.hpp"

#include <algorithm>
#include <iostream>
#include <string>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace parkour::targeting
{
namespace
{
const TargetMatchingState kIdleState{};

glm::vec3 FlatForward(const scene::GlobalTransform& transform)
{
    glm::vec3 forward = transform.Forward();
    forward.y = 0.0F;
    if (glm::length(forward) < 1.0e-4F)
    {
        return glm::vec3{0.0F, 0.0F, -1.0F};
    }
    return glm::normalize(forward);
}

std::ostream& operator<<(std::ostream& out, const glm::vec3& v)
{
    return out << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}
} // namespace

TargetMatcher::TargetMatcher(const animation::BlendingConfig& config)
    : m_config(&config)
{
}

void TargetMatcher::Submit(const TargetMatchRequest& request)
{
    const auto it = m_pending.find(request.bone);
    if (it != m_pending.end() && it->second.request == request)
    {
        return;
    }
    m_pending[request.bone] = PendingRequest{request, true};
}

void TargetMatcher::HandleRequests(scene::World& world, const BoneMap& boneMap, scene::Entity character, float now)
{
    for (auto& [bone, pending] : m_pending)
    {
        if (!pending.dirty)
        {
            continue;
        }

        const std::optional<scene::Entity> boneEntity = boneMap.Get(bone);
        if (!boneEntity.has_value() || !world.HasEntity(*boneEntity))
        {
            if (m_config->verboseTrace)
            {
                std::cout << "[TargetMatching] " << TargetBoneToString(bone) << " not mapped yet, request kept\n";
            }
            continue;
        }

        // The IK-solved bone sits on the proxy, so a live proxy is where the next match starts from
        const IkBinding& binding = EnsureIk(world, character, *boneEntity, pending.request);
        const glm::vec3 startPosition = world.ComputeGlobalTransform(binding.target).position;

        TargetMatchingState& state = m_states[bone];
        state.phase = MatchPhase::Matching;
        state.bone = bone;
        state.request = pending.request;
        state.startTime = now;
        state.startPosition = startPosition;
        state.progress = 0.0F;

        m_curves[bone] = GenerateTargetCurve(pending.request, static_cast<int>(bone), startPosition, Easing::CubicInOut);
        pending.dirty = false;

        if (m_config->verboseTrace)
        {
            std::cout << "[TargetMatching] " << TargetBoneToString(bone) << " matching to "
                      << pending.request.targetPosition << " over " << pending.request.MatchDuration() << "s\n";
        }
    }
}

void TargetMatcher::Progress(scene::World& world, float now)
{
    for (auto& [bone, state] : m_states)
    {
        if (!state.IsMatching() || !state.request.has_value())
        {
            continue;
        }

        const TargetMatchRequest& request = *state.request;
        const float elapsed = now - state.startTime;
        const float matchDuration = request.MatchDuration();
        const float t = matchDuration > 0.0F ? std::clamp(elapsed / matchDuration, 0.0F, 1.0F) : 1.0F;
        state.progress = CubicEaseInOut(t);

        const auto binding = m_bindings.find(bone);
        if (binding != m_bindings.end() && world.HasEntity(binding->second.target))
        {
            world.SetWorldPosition(binding->second.target, glm::mix(state.startPosition, request.targetPosition, state.progress));
        }

        if (elapsed >= matchDuration)
        {
            if (m_config->verboseTrace)
            {
                std::cout << "[TargetMatching] " << TargetBoneToString(bone) << " complete\n";
            }
            state.phase = MatchPhase::Complete;
            state.request.reset();
            state.progress = 1.0F;

            // Only drop the queued request if it is the one that just finished
            const auto pending = m_pending.find(bone);
            if (pending != m_pending.end() && !pending->second.dirty && pending->second.request == request)
            {
                m_pending.erase(pending);
            }
        }
    }
}

IkBinding& TargetMatcher::EnsureIk(
    scene::World& world,
    scene::Entity character,
    scene::Entity boneEntity,
    const TargetMatchRequest& request
)
{
    IkBinding& binding = m_bindings[request.bone];
    binding.bone = boneEntity;

    if (binding.target == scene::kNullEntity || !world.HasEntity(binding.target))
    {
        binding.target = FindProxy(world, character, boneEntity, false);
    }
    if (IsFoot(request.bone) && (binding.pole == scene::kNullEntity || !world.HasEntity(binding.pole)))
    {
        binding.pole = FindProxy(world, character, boneEntity, true);
    }

    const glm::vec3 forward = FlatForward(world.ComputeGlobalTransform(character));
    const glm::vec3 polePosition = request.targetPosition + forward * kPoleForwardDistance;
    const std::string boneName = TargetBoneToString(request.bone);

    // A new target proxy starts on the animated bone; an existing one stays put and Progress moves it
    bool created = false;
    if (binding.target == scene::kNullEntity)
    {
        scene::Transform local;
        local.position = world.ComputeGlobalTransform(boneEntity).position;
        binding.target = world.CreateNamedEntity(boneName + "_IK_Target", scene::kNullEntity, local);
        world.IkTargetProxies()[binding.target] = scene::IkTargetProxyComponent{character, boneEntity, false};
        created = true;
    }

    if (IsFoot(request.bone))
    {
        if (binding.pole == scene::kNullEntity)
        {
            scene::Transform local;
            local.position = polePosition;
            binding.pole = world.CreateNamedEntity(boneName + "_Pole_Target", scene::kNullEntity, local);
            world.IkTargetProxies()[binding.pole] = scene::IkTargetProxyComponent{character, boneEntity, true};
        }
        else
        {
            world.SetWorldPosition(binding.pole, polePosition);
        }
    }

    scene::IkConstraintComponent& constraint = world.IkConstraints()[boneEntity];
    constraint.chainLength = ChainLength(request.bone);
    constraint.iterations = m_config->targetMatching.ikIterations;
    constraint.target = binding.target;
    constraint.poleTarget = binding.pole;
    constraint.poleAngle = 0.0F;
    constraint.enabled = true;

    if (created)
    {
        std::cout << "[TargetMatching] IK constraint on " << boneName << " (chain " << constraint.chainLength
                  << ", " << constraint.iterations << " iterations)\n";
    }
    return binding;
}

scene::Entity TargetMatcher::FindProxy(const scene::World& world, scene::Entity character, scene::Entity boneEntity, bool pole)
{
    for (const auto& [entity, proxy] : world.IkTargetProxies())
    {
        if (proxy.owner == character && proxy.bone == boneEntity && proxy.pole == pole && world.HasEntity(entity))
        {
            return entity;
        }
    }
    return scene::kNullEntity;
}

const TargetMatchingState& TargetMatcher::State(TargetBone bone) const
{
    const auto it = m_states.find(bone);
    return it != m_states.end() ? it->second : kIdleState;
}

const TargetMatchRequest* TargetMatcher::Pending(TargetBone bone) const
{
    const auto it = m_pending.find(bone);
    return it != m_pending.end() ? &it->second.request : nullptr;
}

std::optional<IkBinding> TargetMatcher::Binding(TargetBone bone) const
{
    const auto it = m_bindings.find(bone);
    if (it == m_bindings.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const animation::AnimationClip* TargetMatcher::Curve(TargetBone bone) const
{
    const auto it = m_curves.find(bone);
    return it != m_curves.end() ? &it->second : nullptr;
}

std::size_t TargetMatcher::ActiveMatchCount() const
{
    return static_cast<std::size_t>(std::count_if(m_states.begin(), m_states.end(), [](const auto& entry) {
        return entry.second.IsMatching();
    }));
}

} // namespace parkour::targeting
