#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/trigonometric.hpp>

#include "parkour/animation/AnimationClip.hpp"
#include "parkour/animation/BlendApplier.hpp"
#include "parkour/animation/Pose.hpp"
#include "parkour/animation/PoseExtraction.hpp"
#include "parkour/animation/PoseLibrary.hpp"
#include "parkour/scene/World.hpp"

using Catch::Approx;
using namespace parkour::animation;

namespace
{
BoneTransform At(float x, float y, float z)
{
    BoneTransform transform;
    transform.translation = {x, y, z};
    return transform;
}

std::filesystem::path FreshDirectory(const std::string& name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "parkour_tests" / name;
    std::filesystem::remove_all(dir);
    return dir;
}
} // namespace

TEST_CASE("Blending two poses meets in the middle", "[pose][blend]")
{
    Pose a;
    a.name = "a";
    a.WithBone("Hips", At(0.0F, 0.0F, 0.0F));
    Pose b;
    b.name = "b";
    b.WithBone("Hips", At(1.0F, 1.0F, 1.0F));

    const Pose mid = a.Blend(b, 0.5F);
    REQUIRE(mid.boneTransforms.contains("Hips"));
    CHECK(mid.boneTransforms.at("Hips").translation.x == Approx(0.5F));
    CHECK(mid.boneTransforms.at("Hips").translation.y == Approx(0.5F));
    CHECK(mid.boneTransforms.at("Hips").translation.z == Approx(0.5F));
    CHECK(mid.name == "a_b_blend");

    CHECK(a.Blend(b, 0.0F).boneTransforms.at("Hips").translation.x == Approx(0.0F));
    CHECK(a.Blend(b, 1.0F).boneTransforms.at("Hips").translation.x == Approx(1.0F));
}

TEST_CASE("Rotations blend along the shortest arc", "[pose][blend]")
{
    BoneTransform a;
    BoneTransform b;
    b.rotation = glm::angleAxis(glm::radians(90.0F), glm::vec3{1.0F, 0.0F, 0.0F});

    const BoneTransform mid = Blend(a, b, 0.5F);
    const glm::quat expected = glm::angleAxis(glm::radians(45.0F), glm::vec3{1.0F, 0.0F, 0.0F});
    CHECK(std::abs(glm::dot(mid.rotation, expected)) == Approx(1.0F));
}

TEST_CASE("Bones missing from one pose pass through", "[pose][blend]")
{
    Pose a;
    a.WithBone("Hips", At(0.0F, 0.0F, 0.0F)).WithBone("Head", At(0.0F, 1.7F, 0.0F));
    Pose b;
    b.WithBone("Hips", At(2.0F, 0.0F, 0.0F)).WithBone("LeftHand", At(0.5F, 1.2F, 0.0F));

    const Pose blended = a.Blend(b, 0.25F);
    CHECK(blended.boneTransforms.size() == 3);
    CHECK(blended.boneTransforms.at("Hips").translation.x == Approx(0.5F));
    CHECK(blended.boneTransforms.at("Head").translation.y == Approx(1.7F));
    CHECK(blended.boneTransforms.at("LeftHand").translation.x == Approx(0.5F));
}

TEST_CASE("Weighted blend of several poses", "[pose][blend]")
{
    Pose a;
    a.WithBone("Hips", At(0.0F, 0.0F, 0.0F));
    Pose b;
    b.WithBone("Hips", At(3.0F, 0.0F, 0.0F));
    Pose c;
    c.WithBone("Hips", At(6.0F, 0.0F, 0.0F));

    CHECK_FALSE(Pose::BlendMultiple({}).has_value());

    const std::optional<Pose> single = Pose::BlendMultiple({{&b, 1.0F}});
    REQUIRE(single.has_value());
    CHECK(single->boneTransforms.at("Hips").translation.x == Approx(3.0F));

    const std::optional<Pose> even = Pose::BlendMultiple({{&a, 1.0F}, {&b, 1.0F}, {&c, 1.0F}});
    REQUIRE(even.has_value());
    CHECK(even->boneTransforms.at("Hips").translation.x == Approx(3.0F));

    const std::optional<Pose> skewed = Pose::BlendMultiple({{&a, 0.25F}, {&c, 0.75F}});
    REQUIRE(skewed.has_value());
    CHECK(skewed->boneTransforms.at("Hips").translation.x == Approx(4.5F));
}

TEST_CASE("Pose file stems map back to pose ids", "[pose][library]")
{
    for (const PoseId pose : AllPoses())
    {
        const std::optional<PoseId> parsed = ParsePoseFileStem(PoseFileStem(pose));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == pose);
    }
    CHECK_FALSE(ParsePoseFileStem("moonwalk").has_value());
    CHECK(std::string{PoseFileStem(PoseId::WalkLeftFootForward)} == "walk_left");
}

TEST_CASE("Library reports missing poses", "[pose][library]")
{
    PoseLibrary library;
    CHECK_FALSE(library.IsComplete());
    CHECK(library.MissingPoses().size() == kPoseCount);

    for (const PoseId pose : AllPoses())
    {
        Pose entry;
        entry.name = PoseFileStem(pose);
        library.AddPose(pose, entry);
    }
    CHECK(library.IsComplete());
    CHECK(library.MissingPoses().empty());
    CHECK(library.LoadedCount() == kPoseCount);
}

TEST_CASE("Library saves and reloads pose files", "[pose][library]")
{
    const std::filesystem::path dir = FreshDirectory("pose_library");

    PoseLibrary library;
    Pose idle;
    idle.name = "idle";
    idle.WithBone("mixamorig12:Hips", At(0.0F, 1.0F, 0.0F));
    idle.metadata.sourceAnimation = "idle";
    idle.metadata.sourceTime = 0.5F;
    library.AddPose(PoseId::Idle, idle);

    Pose walk;
    walk.name = "walk_left";
    BoneTransform thigh = At(0.1F, -0.1F, 0.2F);
    thigh.rotation = glm::angleAxis(glm::radians(30.0F), glm::vec3{1.0F, 0.0F, 0.0F});
    walk.WithBone("mixamorig12:LeftUpLeg", thigh);
    library.AddPose(PoseId::WalkLeftFootForward, walk);

    std::string error;
    REQUIRE(library.SaveToDirectory(dir, &error));
    CHECK(std::filesystem::exists(PoseLibrary::PosePath(dir, PoseId::Idle)));
    CHECK(PoseLibrary::PosePath(dir, PoseId::Idle).filename() == "idle.pose.json");

    PoseLibrary reloaded;
    CHECK(reloaded.LoadFromDirectory(dir, &error) == 2);
    REQUIRE(reloaded.Get(PoseId::WalkLeftFootForward) != nullptr);
    const BoneTransform& loadedThigh = reloaded.Get(PoseId::WalkLeftFootForward)->boneTransforms.at("mixamorig12:LeftUpLeg");
    CHECK(loadedThigh.translation.z == Approx(0.2F));
    CHECK(std::abs(glm::dot(loadedThigh.rotation, thigh.rotation)) == Approx(1.0F));

    const Pose* loadedIdle = reloaded.Get(PoseId::Idle);
    REQUIRE(loadedIdle != nullptr);
    REQUIRE(loadedIdle->metadata.sourceTime.has_value());
    CHECK(*loadedIdle->metadata.sourceTime == Approx(0.5F));
    CHECK_FALSE(loadedIdle->metadata.notes.has_value());

    std::filesystem::remove_all(dir);
}

TEST_CASE("Malformed pose files are skipped", "[pose][library]")
{
    const std::filesystem::path dir = FreshDirectory("pose_library_bad");
    std::filesystem::create_directories(dir);
    {
        std::ofstream bad(PoseLibrary::PosePath(dir, PoseId::Crouch));
        bad << R"({ "name": "crouch", "bone_transforms": { "Hips": { "translation": [0, 1] } } })";
    }
    {
        std::ofstream good(PoseLibrary::PosePath(dir, PoseId::Idle));
        good << R"({ "bone_transforms": { "Hips": { "translation": [0, 1, 0], "rotation": [0, 0, 0, 1] } } })";
    }

    PoseLibrary library;
    std::string error;
    CHECK(library.LoadFromDirectory(dir, &error) == 1);
    CHECK(error == "Bone 'Hips' needs translation[3] and rotation[4]");
    REQUIRE(library.Get(PoseId::Idle) != nullptr);
    CHECK(library.Get(PoseId::Idle)->name == "idle");
    CHECK_FALSE(library.Contains(PoseId::Crouch));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Pose JSON requires a bone table", "[pose][library]")
{
    std::string error;
    CHECK_FALSE(PoseLibrary::PoseFromJsonString(R"({ "name": "x" })", &error).has_value());
    CHECK(error == "Missing pose.bone_transforms object");
    CHECK_FALSE(PoseLibrary::PoseFromJsonString("not json", &error).has_value());
    CHECK_FALSE(PoseLibrary::LoadPoseFile("/nonexistent/idle.pose.json", &error).has_value());
}

TEST_CASE("Poses are sampled from clips by joint name", "[pose][extraction]")
{
    AnimationClip clip;
    clip.name = "walk";
    clip.duration = 1.0F;
    TranslationChannel hips;
    hips.jointIndex = 1;
    hips.times = {0.0F, 1.0F};
    hips.values = {glm::vec3{0.0F, 1.0F, 0.0F}, glm::vec3{0.0F, 1.0F, 2.0F}};
    clip.translations.push_back(hips);
    TranslationChannel unnamed;
    unnamed.jointIndex = 7;
    unnamed.times = {0.0F};
    unnamed.values = {glm::vec3{1.0F}};
    clip.translations.push_back(unnamed);

    const std::vector<std::string> nodes{"Armature", "mixamorig12:Hips"};
    const Pose pose = SamplePose(clip, nodes, 0.25F, "walk_left");
    CHECK(pose.name == "walk_left");
    REQUIRE(pose.boneTransforms.size() == 1);
    CHECK(pose.boneTransforms.at("mixamorig12:Hips").translation.z == Approx(0.5F));
    CHECK(pose.metadata.sourceAnimation == std::optional<std::string>{"walk"});

    // Times past the end are clamped to the clip
    CHECK(*SamplePose(clip, nodes, 4.0F, "late").metadata.sourceTime == Approx(1.0F));
}

TEST_CASE("Extraction fills the library from available clips", "[pose][extraction]")
{
    AnimationClip idle;
    idle.name = "idle";
    idle.duration = 1.0F;
    TranslationChannel hips;
    hips.jointIndex = 0;
    hips.times = {0.0F, 1.0F};
    hips.values = {glm::vec3{0.0F, 1.0F, 0.0F}, glm::vec3{0.0F, 0.9F, 0.0F}};
    idle.translations.push_back(hips);

    const ClipLookup lookup = [&idle](const std::string& name) -> const AnimationClip* {
        return name == "idle" ? &idle : nullptr;
    };

    PoseLibrary library;
    const std::vector<ExtractionEntry> table = DefaultExtractionTable();
    CHECK(table.size() == kPoseCount);

    // Only the idle-based entries (idle, rolls, attacks, crouch) have a clip here
    CHECK(ExtractPoses(table, lookup, {"Hips"}, library) == 6);
    CHECK(library.Contains(PoseId::Idle));
    CHECK(library.Contains(PoseId::Crouch));
    CHECK_FALSE(library.Contains(PoseId::WalkLeftFootForward));
    REQUIRE(library.Get(PoseId::Crouch)->metadata.notes.has_value());
    CHECK(library.Get(PoseId::Idle)->boneTransforms.at("Hips").translation.y == Approx(0.95F));
}

TEST_CASE("Evaluated pose lands on matching skeleton bones", "[pose][apply]")
{
    parkour::scene::World world;
    const parkour::scene::Entity root = world.CreateNamedEntity("Player");
    const parkour::scene::Entity hips = world.CreateNamedEntity("mixamorig12:Hips", root);
    const parkour::scene::Entity head = world.CreateNamedEntity("mixamorig12:Head", hips);

    PoseLibrary library;
    Pose walkLeft;
    walkLeft.WithBone("Hips", At(0.0F, 1.0F, 0.0F));
    Pose walkRight;
    walkRight.WithBone("Hips", At(0.0F, 1.0F, 0.4F));
    library.AddPose(PoseId::WalkLeftFootForward, walkLeft);
    library.AddPose(PoseId::WalkRightFootForward, walkRight);

    PoseBlendState blend;
    blend.activePoses = {PoseWeight{PoseId::WalkLeftFootForward, 0.5F}, PoseWeight{PoseId::WalkRightFootForward, 0.5F}};

    const BlendingConfig config;
    const BlendApplier applier(config);
    CHECK(applier.ApplyPose(blend, library, world, root) == 1);
    CHECK(world.Transforms().at(hips).position.z == Approx(0.2F));
    CHECK(world.Transforms().at(head).position.y == 0.0F);

    // Poses that are not loaded contribute nothing
    blend.activePoses = {PoseWeight{PoseId::Crouch, 1.0F}};
    CHECK_FALSE(BlendApplier::EvaluatePose(blend, library).has_value());
    CHECK(applier.ApplyPose(blend, library, world, root) == 0);
}
