#include "parkour/animation/AnimationMixer.hpp"
#include "parkour/animation/AnimationSystem.hpp"
#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/animation/PoseExtraction.hpp"
#include "parkour/animation/PoseLibrary.hpp"
#include "parkour/assets/ClipLoader.hpp"
#include "parkour/core/FixedStepClock.hpp"
#include "parkour/physics/PhysicsWorld.hpp"
#include "parkour/scene/World.hpp"
#include "parkour/targeting/MaskGroups.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/common.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/trigonometric.hpp>

namespace
{
using parkour::scene::Entity;

constexpr const char* kRigPrefix = "mixamorig12";
constexpr float kJumpHeight = 0.6F;

struct DemoOptions
{
    std::string configPath;
    std::string saveConfigPath;
    std::string posesDirectory;
    float seconds = 10.0F;
    bool verbose = false;

    bool extract = false;
    std::string extractSource;
    std::string extractDirectory;
};

struct BoneDef
{
    const char* name;
    const char* parent;  // nullptr = attached to the character root
    glm::vec3 offset;
};

const std::vector<BoneDef>& SkeletonBones()
{
    static const std::vector<BoneDef> kBones{
        {"Hips", nullptr, {0.0F, 1.0F, 0.0F}},
        {"Spine", "Hips", {0.0F, 0.1F, 0.0F}},
        {"Spine1", "Spine", {0.0F, 0.1F, 0.0F}},
        {"Spine2", "Spine1", {0.0F, 0.1F, 0.0F}},
        {"Neck", "Spine2", {0.0F, 0.25F, 0.0F}},
        {"Head", "Neck", {0.0F, 0.1F, 0.0F}},
        {"LeftShoulder", "Spine2", {0.1F, 0.15F, 0.0F}},
        {"LeftArm", "LeftShoulder", {0.1F, 0.0F, 0.0F}},
        {"LeftForeArm", "LeftArm", {0.25F, 0.0F, 0.0F}},
        {"LeftHand", "LeftForeArm", {0.25F, 0.0F, 0.0F}},
        {"RightShoulder", "Spine2", {-0.1F, 0.15F, 0.0F}},
        {"RightArm", "RightShoulder", {-0.1F, 0.0F, 0.0F}},
        {"RightForeArm", "RightArm", {-0.25F, 0.0F, 0.0F}},
        {"RightHand", "RightForeArm", {-0.25F, 0.0F, 0.0F}},
        {"LeftUpLeg", "Hips", {0.1F, -0.05F, 0.0F}},
        {"LeftLeg", "LeftUpLeg", {0.0F, -0.45F, 0.0F}},
        {"LeftFoot", "LeftLeg", {0.0F, -0.45F, 0.0F}},
        {"RightUpLeg", "Hips", {-0.1F, -0.05F, 0.0F}},
        {"RightLeg", "RightUpLeg", {0.0F, -0.45F, 0.0F}},
        {"RightFoot", "RightLeg", {0.0F, -0.45F, 0.0F}},
    };
    return kBones;
}

std::string QualifiedBoneName(const char* bone)
{
    return std::string(kRigPrefix) + ":" + bone;
}

void PrintUsage()
{
    std::cout << "Usage:\n"
              << "  parkour_demo [--config <file>] [--save-config <file>] [--poses <dir>] [--seconds <n>] [--verbose]\n"
              << "  parkour_demo --extract <clips.glb> <output dir>\n";
}

bool ParseArguments(int argc, char** argv, DemoOptions& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue)
        {
            options.configPath = argv[++i];
        }
        else if (arg == "--save-config" && hasValue)
        {
            options.saveConfigPath = argv[++i];
        }
        else if (arg == "--poses" && hasValue)
        {
            options.posesDirectory = argv[++i];
        }
        else if (arg == "--seconds" && hasValue)
        {
            options.seconds = std::strtof(argv[++i], nullptr);
            if (!(options.seconds > 0.0F))
            {
                std::cerr << "[Demo] Error: --seconds must be > 0\n";
                return false;
            }
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--extract" && i + 2 < argc)
        {
            options.extract = true;
            options.extractSource = argv[++i];
            options.extractDirectory = argv[++i];
        }
        else
        {
            std::cerr << "[Demo] Error: unknown or incomplete argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

int RunExtraction(const DemoOptions& options)
{
    const parkour::assets::ClipImportData import = parkour::assets::ClipLoader::LoadFromFile(options.extractSource);
    if (!import.loaded)
    {
        std::cerr << "[Demo] Error: " << import.error << "\n";
        return EXIT_FAILURE;
    }

    const parkour::animation::ClipLookup findClip = [&import](const std::string& name) -> const parkour::animation::AnimationClip* {
        for (const parkour::animation::AnimationClip& clip : import.clips)
        {
            if (clip.name == name)
            {
                return &clip;
            }
        }
        return nullptr;
    };

    parkour::animation::PoseLibrary library;
    const std::size_t extracted =
        parkour::animation::ExtractPoses(parkour::animation::DefaultExtractionTable(), findClip, import.nodeNames, library);

    std::string error;
    if (!library.SaveToDirectory(options.extractDirectory, &error))
    {
        std::cerr << "[Demo] Error: " << error << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "[Demo] Extracted " << extracted << " poses into " << options.extractDirectory << "\n";
    for (const parkour::animation::PoseId missing : library.MissingPoses())
    {
        std::cout << "  missing: " << parkour::animation::PoseDisplayName(missing) << "\n";
    }
    return EXIT_SUCCESS;
}

Entity BuildCharacter(parkour::scene::World& world)
{
    const Entity player = world.CreateNamedEntity("Player");
    std::unordered_map<std::string, Entity> byName;
    for (const BoneDef& bone : SkeletonBones())
    {
        const Entity parent = bone.parent != nullptr ? byName.at(bone.parent) : player;
        parkour::scene::Transform local;
        local.position = bone.offset;
        byName[bone.name] = world.CreateNamedEntity(QualifiedBoneName(bone.name), parent, local);
    }

    world.Motions()[player] = parkour::scene::CharacterMotionComponent{};
    return player;
}

void BuildLevel(parkour::physics::PhysicsWorld& physics, parkour::scene::World& world)
{
    using parkour::physics::SolidBox;

    const Entity ground = world.CreateNamedEntity("Ground");
    physics.AddSolidBox(SolidBox{ground, {0.0F, -0.5F, -10.0F}, {20.0F, 0.5F, 40.0F}});

    // 2 m rise over 6 m, about 18 degrees
    const Entity ramp = world.CreateNamedEntity("Ramp");
    physics.AddSolidQuad(ramp, {-2.0F, 0.0F, -10.0F}, {2.0F, 0.0F, -10.0F}, {2.0F, 2.0F, -16.0F}, {-2.0F, 2.0F, -16.0F});

    const Entity platform = world.CreateNamedEntity("Platform");
    physics.AddSolidBox(SolidBox{platform, {0.0F, 1.0F, -19.0F}, {2.0F, 1.0F, 3.0F}});

    const Entity wall = world.CreateNamedEntity("Wall");
    physics.AddSolidBox(SolidBox{wall, {0.0F, 2.5F, -24.0F}, {3.0F, 2.5F, 0.5F}});
}

// Rest transforms of the demo skeleton with the limbs swung by the given angles (degrees)
parkour::animation::Pose MakeLimbPose(const std::string& name, float leftLeg, float rightLeg, float arms, float hipsDrop)
{
    parkour::animation::Pose pose;
    pose.name = name;
    for (const BoneDef& bone : SkeletonBones())
    {
        parkour::animation::BoneTransform transform;
        transform.translation = bone.offset;
        const std::string boneName = bone.name;
        if (boneName == "LeftUpLeg")
        {
            transform.rotation = glm::angleAxis(glm::radians(leftLeg), glm::vec3{1.0F, 0.0F, 0.0F});
        }
        else if (boneName == "RightUpLeg")
        {
            transform.rotation = glm::angleAxis(glm::radians(rightLeg), glm::vec3{1.0F, 0.0F, 0.0F});
        }
        else if (boneName == "LeftArm" || boneName == "RightArm")
        {
            transform.rotation = glm::angleAxis(glm::radians(arms), glm::vec3{0.0F, 0.0F, 1.0F});
        }
        else if (boneName == "Hips")
        {
            transform.translation.y -= hipsDrop;
        }
        pose.WithBone(QualifiedBoneName(bone.name), transform);
    }
    pose.metadata.notes = "demo rig";
    return pose;
}

void BuildDemoPoses(parkour::animation::PoseLibrary& library)
{
    using parkour::animation::PoseId;
    library.AddPose(PoseId::Idle, MakeLimbPose("idle", 0.0F, 0.0F, -70.0F, 0.0F));
    library.AddPose(PoseId::WalkLeftFootForward, MakeLimbPose("walk_left", -25.0F, 20.0F, -70.0F, 0.02F));
    library.AddPose(PoseId::WalkRightFootForward, MakeLimbPose("walk_right", 20.0F, -25.0F, -70.0F, 0.02F));
    library.AddPose(PoseId::RunLeftFootForward, MakeLimbPose("run_left", -45.0F, 35.0F, -50.0F, 0.06F));
    library.AddPose(PoseId::RunRightFootForward, MakeLimbPose("run_right", 35.0F, -45.0F, -50.0F, 0.06F));
    library.AddPose(PoseId::JumpTakeoff, MakeLimbPose("jump_takeoff", -20.0F, -20.0F, 30.0F, 0.15F));
    library.AddPose(PoseId::JumpAirborne, MakeLimbPose("jump_airborne", -60.0F, -10.0F, 60.0F, 0.0F));
    library.AddPose(PoseId::JumpLanding, MakeLimbPose("jump_landing", -35.0F, -35.0F, -20.0F, 0.25F));
}

// One looping clip per locomotion slot; the bob only makes layer playback observable
std::unique_ptr<parkour::animation::AnimationClip> MakeBobClip(const std::string& name, float duration, float amplitude)
{
    auto clip = std::make_unique<parkour::animation::AnimationClip>();
    clip->name = name;
    clip->duration = duration;

    parkour::animation::TranslationChannel hips;
    hips.jointIndex = 0;
    constexpr int kKeys = 5;
    for (int i = 0; i < kKeys; ++i)
    {
        const float t = duration * static_cast<float>(i) / static_cast<float>(kKeys - 1);
        hips.times.push_back(t);
        hips.values.emplace_back(0.0F, 1.0F + amplitude * std::sin(6.2831853F * t / duration), 0.0F);
    }
    clip->translations.push_back(std::move(hips));
    return clip;
}

struct ScriptSample
{
    std::optional<std::string> actionTag;
    float speed = 0.0F;
    float airborne = -1.0F;  // [0, 1] through the jump arc, negative when on the ground
};

// Idle, walk, run up the ramp, jump onto the platform, walk to the wall, then an unmapped action
ScriptSample SampleScript(float t)
{
    ScriptSample sample;
    if (t < 1.0F)
    {
        return sample;
    }
    if (t < 3.0F)
    {
        sample.speed = 1.5F;
        return sample;
    }
    if (t < 5.4F)
    {
        sample.speed = 5.0F;
        return sample;
    }
    if (t < 6.0F)
    {
        sample.actionTag = "jump";
        sample.speed = 5.0F;
        if (t >= 5.5F && t < 5.9F)
        {
            sample.airborne = (t - 5.5F) / 0.4F;
        }
        return sample;
    }
    if (t < 9.0F)
    {
        sample.speed = 1.5F;
        return sample;
    }
    sample.actionTag = "vault";
    return sample;
}

int RunSimulation(parkour::animation::BlendingConfig& config, const DemoOptions& options)
{
    parkour::scene::World world;
    parkour::physics::PhysicsWorld physics;
    BuildLevel(physics, world);
    const Entity player = BuildCharacter(world);
    physics.AddSolidBox(parkour::physics::SolidBox{player, {0.0F, 0.9F, 0.0F}, {0.3F, 0.9F, 0.3F}});

    const parkour::targeting::MaskGroupConfig masks = parkour::targeting::MaskGroupConfig::ForMixamo(kRigPrefix);
    for (const parkour::targeting::TargetBone bone : parkour::targeting::kAllTargetBones)
    {
        const std::string boneName = parkour::targeting::MixamoFullName(bone, kRigPrefix);
        const std::optional<std::uint32_t> group = masks.GroupForBone(boneName);
        std::cout << "[Demo] " << boneName << " group " << (group.has_value() ? std::to_string(*group) : "-")
                  << " mask without it 0x" << std::hex << parkour::targeting::MaskGroupConfig::MaskExcludingBone(bone)
                  << std::dec << "\n";
    }

    parkour::animation::PoseLibrary poses;
    if (!options.posesDirectory.empty())
    {
        std::string error;
        if (poses.LoadFromDirectory(options.posesDirectory, &error) == 0)
        {
            std::cerr << "[Demo] Warning: no poses loaded from " << options.posesDirectory
                      << (error.empty() ? std::string() : " (" + error + ")") << ", using built-in poses\n";
        }
    }
    if (poses.LoadedCount() == 0)
    {
        BuildDemoPoses(poses);
    }
    if (!poses.IsComplete())
    {
        std::cout << "[Demo] Pose library has " << poses.LoadedCount() << "/" << parkour::animation::kPoseCount
                  << " poses\n";
    }

    parkour::animation::AnimationMixer mixer;
    mixer.AddClip(MakeBobClip(config.clips.idle, 2.0F, 0.01F));
    mixer.AddClip(MakeBobClip(config.clips.walk, 1.0F, 0.03F));
    mixer.AddClip(MakeBobClip(config.clips.run, 0.6F, 0.05F));
    mixer.AddClip(MakeBobClip(config.clips.standingJump, 0.8F, 0.3F));
    mixer.AddClip(MakeBobClip(config.clips.runningJump, 0.7F, 0.25F));

    parkour::animation::AnimationSystem system(config, world, physics);
    std::string initError;
    if (!system.Initialize(&initError))
    {
        std::cerr << "[Demo] Error: " << initError << "\n";
        return EXIT_FAILURE;
    }
    system.SetPoseLibrary(&poses);
    system.AddCharacter(player, &mixer);

    parkour::core::FixedStepClock clock(1.0 / 60.0);
    const parkour::physics::EntityFilter self{player};
    float nextReport = 0.0F;
    float takeoffHeight = 0.0F;
    int frame = 0;

    while (clock.SimulatedSeconds() < options.seconds)
    {
        // Uneven frame pacing, stepped at a fixed rate
        clock.AdvanceFrame(frame++ % 2 == 0 ? 1.0 / 45.0 : 1.0 / 75.0);
        while (clock.ShouldStep() && clock.SimulatedSeconds() < options.seconds)
        {
            const float dt = static_cast<float>(clock.FixedDeltaSeconds());
            const float now = static_cast<float>(clock.SimulatedSeconds());
            const ScriptSample script = SampleScript(now);

            parkour::scene::Transform& root = world.Transforms()[player];
            parkour::scene::CharacterMotionComponent& motion = world.Motions()[player];
            motion.velocity = glm::vec3{0.0F, 0.0F, -script.speed};
            motion.actionTag = script.actionTag;
            root.position += motion.velocity * dt;

            const glm::vec3 probeOrigin = root.position + glm::vec3{0.0F, 1.5F, 0.0F};
            const std::optional<parkour::physics::RaycastHit> ground =
                physics.CastRay(probeOrigin, glm::vec3{0.0F, -1.0F, 0.0F}, 5.0F, self);
            if (script.airborne >= 0.0F)
            {
                const float arc = 4.0F * kJumpHeight * script.airborne * (1.0F - script.airborne);
                const float floor = ground.has_value() ? ground->position.y : takeoffHeight;
                root.position.y = std::max(floor, takeoffHeight + arc);
                motion.grounded = false;
            }
            else
            {
                if (ground.has_value())
                {
                    root.position.y = ground->position.y;
                    motion.groundNormal = ground->normal;
                }
                takeoffHeight = root.position.y;
                motion.grounded = true;
            }
            // The controller needs a couple of steps before it reports a basis
            motion.basisReady = clock.StepIndex() >= 3;
            physics.UpdateBoxCenter(player, root.position + glm::vec3{0.0F, 0.9F, 0.0F});

            mixer.Update(dt);
            system.Update(dt);
            clock.ConsumeStep();

            if (now >= nextReport)
            {
                nextReport += 0.5F;
                std::cout << "[Demo] t=" << std::fixed << std::setprecision(2) << now << "s pos=("
                          << root.position.x << ", " << root.position.y << ", " << root.position.z << ")\n"
                          << system.GetDebugInfo(player) << mixer.GetDebugInfo();
            }
        }
    }

    const parkour::animation::CharacterRig* rig = system.Rig(player);
    if (rig != nullptr)
    {
        for (const parkour::targeting::TargetBone bone : parkour::targeting::kAllTargetBones)
        {
            const parkour::targeting::TargetMatchingState& state = rig->matcher.State(bone);
            if (state.phase != parkour::targeting::MatchPhase::Idle)
            {
                std::cout << "[Demo] " << parkour::targeting::TargetBoneToString(bone) << ": "
                          << parkour::targeting::MatchPhaseToString(state.phase) << "\n";
            }
        }
    }
    return EXIT_SUCCESS;
}
} // namespace

int main(int argc, char** argv)
{
    DemoOptions options;
    if (!ParseArguments(argc, argv, options))
    {
        PrintUsage();
        return EXIT_FAILURE;
    }

    if (options.extract)
    {
        return RunExtraction(options);
    }

    parkour::animation::BlendingConfig config;
    if (!options.configPath.empty())
    {
        std::string error;
        if (!config.LoadFromJsonFile(options.configPath, &error))
        {
            std::cerr << "[Demo] Warning: " << error << ", using defaults\n";
        }
    }
    if (options.verbose)
    {
        config.verboseTrace = true;
    }
    if (!options.saveConfigPath.empty())
    {
        std::string error;
        if (!config.SaveToJsonFile(options.saveConfigPath, &error))
        {
            std::cerr << "[Demo] Warning: " << error << "\n";
        }
    }

    return RunSimulation(config, options);
}
