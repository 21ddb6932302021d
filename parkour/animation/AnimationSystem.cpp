#include "parkour/animation/AnimationSystem.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace parkour::animation
{

AnimationSystem::AnimationSystem(const BlendingConfig& config, scene::World& world, const physics::PhysicsWorld& physics)
    : m_config(&config)
    , m_world(&world)
    , m_blender(config)
    , m_applier(config)
    , m_resolver(physics)
    , m_placement(config)
{
}

bool AnimationSystem::Initialize(std::string* outError)
{
    if (m_initialized)
    {
        return true;
    }

    std::string error;
    if (!m_config->Validate(&error))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid locomotion config: " + error;
        }
        return false;
    }

    m_initialized = true;
    return true;
}

bool AnimationSystem::EnsureInitialized()
{
    std::string error;
    if (Initialize(&error))
    {
        return true;
    }
    if (!m_reportedInvalidConfig)
    {
        std::cerr << "[AnimationSystem] Error: " << error << ", characters are not updated\n";
        m_reportedInvalidConfig = true;
    }
    return false;
}

bool AnimationSystem::AddCharacter(scene::Entity entity, AnimationPlayback* playback)
{
    return m_rigs.try_emplace(entity, entity, *m_config, playback).second;
}

void AnimationSystem::RemoveCharacter(scene::Entity entity)
{
    m_rigs.erase(entity);
}

const CharacterRig* AnimationSystem::Rig(scene::Entity entity) const
{
    const auto it = m_rigs.find(entity);
    return it != m_rigs.end() ? &it->second : nullptr;
}

CharacterRig* AnimationSystem::RigMut(scene::Entity entity)
{
    const auto it = m_rigs.find(entity);
    return it != m_rigs.end() ? &it->second : nullptr;
}

void AnimationSystem::Update(float dt)
{
    if (!EnsureInitialized())
    {
        return;
    }

    m_time += dt;

    for (auto& [entity, rig] : m_rigs)
    {
        UpdateLocomotion(rig, dt);
    }
    for (auto& [entity, rig] : m_rigs)
    {
        UpdateTargeting(rig, dt);
    }
}

void AnimationSystem::UpdateLocomotion(CharacterRig& rig, float dt)
{
    const auto motionIt = m_world->Motions().find(rig.entity);
    if (motionIt == m_world->Motions().end() || !motionIt->second.basisReady)
    {
        if (m_config->verboseTrace)
        {
            std::cout << "[Locomotion] Entity " << rig.entity << " has no kinematic basis yet, skipping\n";
        }
        return;
    }

    const scene::CharacterMotionComponent& motion = motionIt->second;
    rig.state = rig.classifier.Classify(motion.actionTag, motion.velocity);

    const StateTransition transition = m_blender.Tick(rig.state, motion, dt, rig.track, rig.blend);
    if (transition.directive == StateDirective::Alter && m_config->verboseTrace)
    {
        std::cout << "[Locomotion] Entity " << rig.entity << " -> " << ToString(rig.state) << "\n";
    }

    if (rig.playback != nullptr)
    {
        m_applier.ApplyPlayback(transition, rig.blend, *rig.playback);
    }
    if (m_poseLibrary != nullptr)
    {
        m_applier.ApplyPose(rig.blend, *m_poseLibrary, *m_world, rig.entity);
    }
}

void AnimationSystem::UpdateTargeting(CharacterRig& rig, float dt)
{
    if (!rig.boneMap.EnsureBuilt(*m_world, rig.entity, m_config->verboseTrace))
    {
        return;
    }

    m_placement.UpdateFeet(*m_world, m_resolver, rig.boneMap, rig.entity, dt, rig.footTimer, rig.matcher);
    m_placement.UpdateHands(*m_world, m_resolver, rig.boneMap, rig.entity, dt, rig.handTimer, rig.matcher);
    rig.matcher.HandleRequests(*m_world, rig.boneMap, rig.entity, m_time);
    rig.matcher.Progress(*m_world, m_time);
}

std::string AnimationSystem::GetDebugInfo(scene::Entity entity) const
{
    const CharacterRig* rig = Rig(entity);
    if (rig == nullptr)
    {
        return "Not registered";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "State: " << ToString(rig->state) << "\n";
    oss << "Contact: " << ContactStateToString(rig->blend.contactState) << "\n";
    oss << "Speed: " << rig->blend.velocity << " m/s  Phase: " << rig->blend.footPhase
        << "  Stride: " << rig->blend.strideLength << " m\n";
    oss << "Weights: idle " << rig->blend.locomotion.Idle() << " walk " << rig->blend.locomotion.Walk() << " run "
        << rig->blend.locomotion.Run() << "\n";
    oss << "Poses:";
    for (const PoseWeight& entry : rig->blend.activePoses)
    {
        oss << " " << PoseDisplayName(entry.pose) << "=" << entry.weight;
    }
    oss << "\n";
    oss << "Bones: " << rig->boneMap.Size() << "  Active matches: " << rig->matcher.ActiveMatchCount() << "\n";
    return oss.str();
}

} // namespace parkour::animation
