#pragma once

#include "parkour/animation/AnimationPlayback.hpp"
#include "parkour/animation/AnimationState.hpp"
#include "parkour/animation/BlendApplier.hpp"
#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/animation/MotionClassifier.hpp"
#include "parkour/animation/PoseBlender.hpp"
#include "parkour/animation/PoseLibrary.hpp"
#include "parkour/physics/PhysicsWorld.hpp"
#include "parkour/scene/World.hpp"
#include "parkour/targeting/BoneMap.hpp"
#include "parkour/targeting/PlacementSystems.hpp"
#include "parkour/targeting/TargetMatcher.hpp"
#include "parkour/targeting/TargetResolver.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace parkour::animation
{

// Everything the locomotion and targeting passes keep for one character
struct CharacterRig
{
    CharacterRig(scene::Entity entityIn, const BlendingConfig& config, AnimationPlayback* playbackIn)
        : entity(entityIn), classifier(config), matcher(config), playback(playbackIn)
    {
    }

    scene::Entity entity = scene::kNullEntity;
    MotionClassifier classifier;
    AnimationState state;
    BlendTrack track;
    PoseBlendState blend;
    targeting::BoneMap boneMap;
    targeting::TargetMatcher matcher;
    float footTimer = 0.0F;
    float handTimer = 0.0F;
    AnimationPlayback* playback = nullptr;  // not owned, may be null
};

// Runs the per-tick chain for every registered character:
// classify -> blend -> apply, then bone map -> placement -> request handling -> matching progress.
class AnimationSystem
{
public:
    // `config`, `world` and `physics` must outlive the system
    AnimationSystem(const BlendingConfig& config, scene::World& world, const physics::PhysicsWorld& physics);

    // Validates the configuration. Update does nothing while it is invalid.
    bool Initialize(std::string* outError = nullptr);
    [[nodiscard]] bool IsInitialized() const { return m_initialized; }

    // `playback` is optional and not owned. Returns false if already registered.
    bool AddCharacter(scene::Entity entity, AnimationPlayback* playback = nullptr);
    void RemoveCharacter(scene::Entity entity);
    [[nodiscard]] std::size_t CharacterCount() const { return m_rigs.size(); }

    // Poses applied to the skeletons; null disables pose evaluation
    void SetPoseLibrary(const PoseLibrary* library) { m_poseLibrary = library; }

    void Update(float dt);

    [[nodiscard]] float Time() const { return m_time; }
    [[nodiscard]] const CharacterRig* Rig(scene::Entity entity) const;
    [[nodiscard]] CharacterRig* RigMut(scene::Entity entity);

    [[nodiscard]] std::string GetDebugInfo(scene::Entity entity) const;

private:
    bool EnsureInitialized();
    void UpdateLocomotion(CharacterRig& rig, float dt);
    void UpdateTargeting(CharacterRig& rig, float dt);

    const BlendingConfig* m_config = nullptr;
    scene::World* m_world = nullptr;
    PoseBlender m_blender;
    BlendApplier m_applier;
    targeting::TargetResolver m_resolver;
    targeting::PlacementSystem m_placement;
    const PoseLibrary* m_poseLibrary = nullptr;
    std::unordered_map<scene::Entity, CharacterRig> m_rigs;
    float m_time = 0.0F;
    bool m_initialized = false;
    bool m_reportedInvalidConfig = false;
};

} // namespace parkour::animation
