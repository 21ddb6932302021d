// Target match requests, easing, curves and the per-bone matching state machine
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <optional>
#include <string>

#include <glm/geometric.hpp>

#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/scene/World.hpp"
#include "parkour/targeting/BoneMap.hpp"
#include "parkour/targeting/CurveGenerator.hpp"
#include "parkour/targeting/TargetMatcher.hpp"
#include "parkour/targeting/TargetMatching.hpp"

using Catch::Approx;
using namespace parkour::targeting;
using parkour::scene::Entity;

namespace
{
struct MatchFixture
{
    parkour::animation::BlendingConfig config;
    parkour::scene::World world;
    Entity character = 0;
    Entity leftFoot = 0;
    Entity leftHand = 0;
    BoneMap bones;

    MatchFixture()
    {
        character = world.CreateNamedEntity("Player");
        parkour::scene::Transform hipsLocal;
        hipsLocal.position = {0.0F, 1.0F, 0.0F};
        const Entity hips = world.CreateNamedEntity("mixamorig12:Hips", character, hipsLocal);

        parkour::scene::Transform footLocal;
        footLocal.position = {0.1F, -0.5F, 0.0F};
        leftFoot = world.CreateNamedEntity("mixamorig12:LeftFoot", hips, footLocal);

        parkour::scene::Transform handLocal;
        handLocal.position = {0.5F, 0.4F, 0.0F};
        leftHand = world.CreateNamedEntity("mixamorig12:LeftHand", hips, handLocal);

        bones.Build(world, character);
    }

    [[nodiscard]] std::size_t ProxyCount() const { return world.IkTargetProxies().size(); }
};

TargetMatchRequest MakeRequest(TargetBone bone, const glm::vec3& target, float duration = 1.0F)
{
    const std::optional<TargetMatchRequest> request = TargetMatchRequest::Create(bone, target, duration);
    REQUIRE(request.has_value());
    return *request;
}
} // namespace

TEST_CASE("Requests validate window and duration", "[matching][request]")
{
    std::string error;

    CHECK(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{0.0F, 1.0F}, &error).has_value());
    CHECK(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{0.2F, 0.5F}, &error).has_value());

    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{0.5F, 0.5F}, &error).has_value());
    CHECK_FALSE(error.empty());
    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{0.6F, 0.4F}).has_value());
    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{-0.1F, 0.4F}).has_value());
    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F, MatchWindow{0.0F, 1.2F}).has_value());

    error.clear();
    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, 0.0F, MatchWindow{}, &error).has_value());
    CHECK(error == "Animation duration must be > 0");
    CHECK_FALSE(TargetMatchRequest::Create(TargetBone::LeftFoot, glm::vec3{0.0F}, -2.0F).has_value());
}

TEST_CASE("Time range scales the window by the duration", "[matching][request]")
{
    const auto request =
        TargetMatchRequest::Create(TargetBone::RightHand, glm::vec3{1.0F}, 2.0F, MatchWindow{0.25F, 0.75F});
    REQUIRE(request.has_value());

    const auto [start, end] = request->TimeRange();
    CHECK(start == Approx(0.5F));
    CHECK(end == Approx(1.5F));
    CHECK(request->MatchDuration() == Approx(1.0F));

    const TargetMatchRequest defaults = MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F}, 0.1F);
    CHECK(defaults.MatchDuration() == Approx(0.08F));
}

TEST_CASE("Cubic ease-in-out hits its anchor points", "[matching][easing]")
{
    CHECK(CubicEaseInOut(0.0F) == 0.0F);
    CHECK(CubicEaseInOut(0.5F) == Approx(0.5F));
    CHECK(CubicEaseInOut(1.0F) == Approx(1.0F));
    CHECK(CubicEaseInOut(0.25F) == Approx(0.0625F));
    CHECK(CubicEaseInOut(0.75F) == Approx(0.9375F));

    float previous = 0.0F;
    for (int i = 1; i <= 20; ++i)
    {
        const float value = CubicEaseInOut(static_cast<float>(i) / 20.0F);
        CHECK(value >= previous);
        previous = value;
    }
}

TEST_CASE("Easing functions bend the curve the expected way", "[matching][easing]")
{
    CHECK(ApplyEasing(Easing::Linear, 0.5F) == 0.5F);
    CHECK(ApplyEasing(Easing::EaseIn, 0.5F) < 0.5F);
    CHECK(ApplyEasing(Easing::EaseOut, 0.5F) > 0.5F);
    CHECK(ApplyEasing(Easing::EaseInOut, 0.5F) == Approx(0.5F));
    CHECK(ApplyEasing(Easing::EaseInOut, 0.25F) < 0.25F);
    CHECK(ApplyEasing(Easing::CubicInOut, 0.25F) == Approx(0.0625F));

    CHECK(ApplyEasing(Easing::EaseOut, -3.0F) == 0.0F);
    CHECK(ApplyEasing(Easing::EaseIn, 7.0F) == 1.0F);
}

TEST_CASE("Generated curves span the time range with N + 1 keyframes", "[matching][curve]")
{
    const auto request =
        TargetMatchRequest::Create(TargetBone::LeftHand, glm::vec3{1.0F, 2.0F, 3.0F}, 2.0F, MatchWindow{0.1F, 0.6F});
    REQUIRE(request.has_value());

    const parkour::animation::AnimationClip linear = GenerateTargetCurve(*request, 7, glm::vec3{0.0F});
    REQUIRE(linear.translations.size() == 1);
    const auto& channel = linear.translations.front();
    CHECK(channel.jointIndex == 7);
    REQUIRE(channel.KeyCount() == kLinearCurveSegments + 1);
    CHECK(channel.times.front() == Approx(0.2F));
    CHECK(channel.times.back() == Approx(1.2F));
    CHECK(channel.values.front() == glm::vec3{0.0F});
    CHECK(channel.values.back().x == Approx(1.0F));
    CHECK(channel.values.back().z == Approx(3.0F));
    CHECK(linear.duration == Approx(2.0F));

    const parkour::animation::AnimationClip eased = GenerateTargetCurve(*request, 7, glm::vec3{0.0F}, Easing::EaseIn);
    REQUIRE(eased.translations.front().KeyCount() == kEasedCurveSegments + 1);

    // Halfway through the window the ease-in curve has covered a quarter of the way
    glm::vec3 sampled{-1.0F};
    eased.SampleTranslation(7, 0.7F, sampled);
    CHECK(sampled.y == Approx(0.5F).margin(1.0e-3));
}

TEST_CASE("Root offset moves the bone onto the target", "[matching][curve]")
{
    const glm::vec3 offset = CalculateRootOffset(glm::vec3{1.0F, 0.5F, 0.0F}, glm::vec3{2.0F, 0.5F, 0.0F}, glm::vec3{0.0F});
    CHECK(offset == glm::vec3{1.0F, 0.0F, 0.0F});
}

TEST_CASE("Matching runs Idle -> Matching -> Complete", "[matching][state]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);
    const glm::vec3 target{0.1F, 0.0F, 0.0F};

    CHECK(matcher.State(TargetBone::LeftFoot).phase == MatchPhase::Idle);

    matcher.Submit(MakeRequest(TargetBone::LeftFoot, target, 1.0F));
    REQUIRE(matcher.Pending(TargetBone::LeftFoot) != nullptr);

    matcher.HandleRequests(fx.world, fx.bones, fx.character, 2.0F);
    const TargetMatchingState& state = matcher.State(TargetBone::LeftFoot);
    CHECK(state.phase == MatchPhase::Matching);
    CHECK(state.startTime == 2.0F);
    REQUIRE(state.ActiveRequest() != nullptr);
    CHECK(state.ActiveRequest()->targetPosition == target);
    CHECK(state.startPosition.y == Approx(0.5F));
    CHECK(matcher.ActiveMatchCount() == 1);

    // Halfway through the 0.8 s match the eased proxy sits halfway
    matcher.Progress(fx.world, 2.4F);
    CHECK(state.phase == MatchPhase::Matching);
    const std::optional<IkBinding> binding = matcher.Binding(TargetBone::LeftFoot);
    REQUIRE(binding.has_value());
    CHECK(fx.world.ComputeGlobalTransform(binding->target).position.y == Approx(0.25F));

    matcher.Progress(fx.world, 3.0F);
    CHECK(state.phase == MatchPhase::Complete);
    CHECK(state.bone == TargetBone::LeftFoot);
    CHECK(matcher.Pending(TargetBone::LeftFoot) == nullptr);
    CHECK(fx.world.ComputeGlobalTransform(binding->target).position.y == Approx(0.0F).margin(1.0e-5));
    CHECK(matcher.ActiveMatchCount() == 0);
}

TEST_CASE("First request builds the IK constraint and proxies", "[matching][ik]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F, 0.0F, -1.0F}));
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);

    const auto constraintIt = fx.world.IkConstraints().find(fx.leftFoot);
    REQUIRE(constraintIt != fx.world.IkConstraints().end());
    const parkour::scene::IkConstraintComponent& constraint = constraintIt->second;
    CHECK(constraint.chainLength == 3);
    CHECK(constraint.iterations == 20);
    CHECK(constraint.enabled);
    CHECK(constraint.poleAngle == 0.0F);

    const std::optional<IkBinding> binding = matcher.Binding(TargetBone::LeftFoot);
    REQUIRE(binding.has_value());
    CHECK(constraint.target == binding->target);
    CHECK(constraint.poleTarget == binding->pole);
    REQUIRE(fx.world.NameOf(binding->target) != nullptr);
    CHECK(*fx.world.NameOf(binding->target) == "LeftFoot_IK_Target");

    // Character faces -Z, so the knee pole sits one metre further along -Z
    const glm::vec3 pole = fx.world.ComputeGlobalTransform(binding->pole).position;
    CHECK(pole.z == Approx(-2.0F));
    CHECK(fx.ProxyCount() == 2);
}

TEST_CASE("Hands get a constraint without a pole target", "[matching][ik]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    matcher.Submit(MakeRequest(TargetBone::LeftHand, glm::vec3{0.5F, 1.4F, -1.0F}, 0.5F));
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);

    const auto constraintIt = fx.world.IkConstraints().find(fx.leftHand);
    REQUIRE(constraintIt != fx.world.IkConstraints().end());
    CHECK(constraintIt->second.chainLength == 3);
    CHECK(constraintIt->second.poleTarget == parkour::scene::kNullEntity);
    CHECK(fx.ProxyCount() == 1);
}

TEST_CASE("Repeated requests reuse the proxy for a bone", "[matching][ik]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    float now = 0.0F;
    for (int i = 0; i < 5; ++i)
    {
        matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F, 0.01F * static_cast<float>(i), 0.0F}, 0.1F));
        matcher.HandleRequests(fx.world, fx.bones, fx.character, now);
        now += 0.1F;
        matcher.Progress(fx.world, now);
    }

    CHECK(fx.ProxyCount() == 2);
    CHECK(fx.world.IkConstraints().size() == 1);

    // A fresh matcher on the same world finds the existing proxies
    TargetMatcher second(fx.config);
    second.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F}, 0.1F));
    second.HandleRequests(fx.world, fx.bones, fx.character, now);
    CHECK(fx.ProxyCount() == 2);
}

TEST_CASE("Hand proxy converges while its target keeps shifting", "[matching][ik]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    // A fresh hand ray every 0.1 s; the walk bob moves each hit up or down a little
    float now = 0.0F;
    glm::vec3 target{0.0F};
    for (int i = 0; i < 80; ++i)
    {
        const float bob = (i % 2 == 0) ? 0.02F : -0.02F;
        target = glm::vec3{0.5F, 1.4F + bob, -1.0F};
        matcher.Submit(MakeRequest(TargetBone::LeftHand, target, 0.5F));
        matcher.HandleRequests(fx.world, fx.bones, fx.character, now);
        now += 0.1F;
        matcher.Progress(fx.world, now);
    }

    const std::optional<IkBinding> binding = matcher.Binding(TargetBone::LeftHand);
    REQUIRE(binding.has_value());
    const glm::vec3 proxy = fx.world.ComputeGlobalTransform(binding->target).position;
    CHECK(glm::distance(proxy, target) < 0.05F);
    CHECK(proxy.z == Approx(-1.0F).margin(0.01));
    CHECK(fx.ProxyCount() == 1);
}

TEST_CASE("Re-triggering a finished match leaves the proxy on the contact", "[matching][ik]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);
    const TargetMatchRequest request = MakeRequest(TargetBone::LeftHand, glm::vec3{0.5F, 1.4F, -1.0F}, 0.5F);

    matcher.Submit(request);
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);
    CHECK(matcher.State(TargetBone::LeftHand).startPosition.z == Approx(0.0F));
    matcher.Progress(fx.world, 0.5F);
    REQUIRE(matcher.State(TargetBone::LeftHand).phase == MatchPhase::Complete);

    matcher.Submit(request);
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 1.0F);
    REQUIRE(matcher.State(TargetBone::LeftHand).phase == MatchPhase::Matching);
    CHECK(matcher.State(TargetBone::LeftHand).startPosition.z == Approx(-1.0F));

    matcher.Progress(fx.world, 1.1F);
    const std::optional<IkBinding> binding = matcher.Binding(TargetBone::LeftHand);
    REQUIRE(binding.has_value());
    CHECK(fx.world.ComputeGlobalTransform(binding->target).position.z == Approx(-1.0F));
}

TEST_CASE("Identical request after completion starts a new cycle", "[matching][state]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);
    const TargetMatchRequest request = MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F}, 0.5F);

    matcher.Submit(request);
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);

    // Same request again while matching does not restart it
    matcher.Submit(request);
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.2F);
    CHECK(matcher.State(TargetBone::LeftFoot).startTime == 0.0F);

    matcher.Progress(fx.world, 0.5F);
    REQUIRE(matcher.State(TargetBone::LeftFoot).phase == MatchPhase::Complete);

    matcher.Submit(request);
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 1.0F);
    CHECK(matcher.State(TargetBone::LeftFoot).phase == MatchPhase::Matching);
    CHECK(matcher.State(TargetBone::LeftFoot).startTime == 1.0F);
}

TEST_CASE("A changed request restarts matching", "[matching][state]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F}, 1.0F));
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);

    matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F, 0.2F, 0.0F}, 1.0F));
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.3F);
    const TargetMatchingState& state = matcher.State(TargetBone::LeftFoot);
    CHECK(state.phase == MatchPhase::Matching);
    CHECK(state.startTime == 0.3F);
    CHECK(state.ActiveRequest()->targetPosition.y == Approx(0.2F));
}

TEST_CASE("Requests wait for their bone to be mapped", "[matching][state]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);
    BoneMap empty;

    matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.0F}));
    matcher.HandleRequests(fx.world, empty, fx.character, 0.0F);
    CHECK(matcher.State(TargetBone::LeftFoot).phase == MatchPhase::Idle);
    CHECK(fx.ProxyCount() == 0);

    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.5F);
    CHECK(matcher.State(TargetBone::LeftFoot).phase == MatchPhase::Matching);
    CHECK(matcher.State(TargetBone::LeftFoot).startTime == 0.5F);
}

TEST_CASE("Matching publishes a curve toward the target", "[matching][curve]")
{
    MatchFixture fx;
    TargetMatcher matcher(fx.config);

    CHECK(matcher.Curve(TargetBone::LeftFoot) == nullptr);
    matcher.Submit(MakeRequest(TargetBone::LeftFoot, glm::vec3{0.1F, 0.0F, 0.0F}));
    matcher.HandleRequests(fx.world, fx.bones, fx.character, 0.0F);

    const parkour::animation::AnimationClip* curve = matcher.Curve(TargetBone::LeftFoot);
    REQUIRE(curve != nullptr);
    REQUIRE(curve->translations.size() == 1);
    CHECK(curve->translations.front().KeyCount() == kEasedCurveSegments + 1);
    CHECK(curve->translations.front().values.back().y == Approx(0.0F).margin(1.0e-5));
}
