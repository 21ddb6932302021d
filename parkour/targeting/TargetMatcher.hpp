#pragma once

#include "parkour/animation/AnimationClip.hpp"
#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/scene/World.hpp"
#include "parkour/targeting/BoneMap.hpp"
#include "parkour/targeting/TargetMatching.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace parkour::targeting
{

// Pole targets sit this far along the character's facing from the foot target
inline constexpr float kPoleForwardDistance = 1.0F;

// Entities spawned for one bone's IK constraint
struct IkBinding
{
    scene::Entity bone = scene::kNullEntity;
    scene::Entity target = scene::kNullEntity;
    scene::Entity pole = scene::kNullEntity;  // feet only
};

// Per-character target matching. Each bone has its own request slot and
// state machine; matching drives IK target proxies in the World.
class TargetMatcher
{
public:
    explicit TargetMatcher(const animation::BlendingConfig& config);

    // Queues `request` for its bone, replacing any pending one. Re-submitting
    // the request that is already pending is a no-op.
    void Submit(const TargetMatchRequest& request);

    // Moves bones with a new or changed request into Matching. A match starts
    // from the bone's existing proxy, or from the bone itself the first time.
    // Requests whose bone is not in `boneMap` yet stay queued.
    void HandleRequests(scene::World& world, const BoneMap& boneMap, scene::Entity character, float now);

    // Eases every matching proxy toward its target and completes finished matches
    void Progress(scene::World& world, float now);

    [[nodiscard]] const TargetMatchingState& State(TargetBone bone) const;
    [[nodiscard]] const TargetMatchRequest* Pending(TargetBone bone) const;
    [[nodiscard]] std::optional<IkBinding> Binding(TargetBone bone) const;
    // Translation curve generated for the last match of `bone`
    [[nodiscard]] const animation::AnimationClip* Curve(TargetBone bone) const;
    [[nodiscard]] std::size_t ActiveMatchCount() const;

private:
    struct PendingRequest
    {
        TargetMatchRequest request;
        bool dirty = true;
    };

    // Creates the constraint and proxies the first time, afterwards only moves the pole
    IkBinding& EnsureIk(scene::World& world, scene::Entity character, scene::Entity boneEntity, const TargetMatchRequest& request);
    [[nodiscard]] static scene::Entity FindProxy(const scene::World& world, scene::Entity character, scene::Entity boneEntity, bool pole);

    const animation::BlendingConfig* m_config = nullptr;
    std::unordered_map<TargetBone, PendingRequest> m_pending;
    std::unordered_map<TargetBone, TargetMatchingState> m_states;
    std::unordered_map<TargetBone, IkBinding> m_bindings;
    std::unordered_map<TargetBone, animation::AnimationClip> m_curves;
};

} // namespace parkour::targeting
