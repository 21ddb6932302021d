// Motion classification, pose blending and stride tests
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>

#include <glm/geometric.hpp>

#include "parkour/animation/BlendingConfig.hpp"
#include "parkour/animation/MotionClassifier.hpp"
#include "parkour/animation/PoseBlender.hpp"
#include "parkour/animation/Stride.hpp"

using Catch::Approx;
using namespace parkour::animation;

namespace
{
parkour::scene::CharacterMotionComponent Moving(float speed, bool grounded = true)
{
    parkour::scene::CharacterMotionComponent motion;
    motion.velocity = glm::vec3{0.0F, 0.0F, -speed};
    motion.grounded = grounded;
    motion.basisReady = true;
    return motion;
}
} // namespace

TEST_CASE("Classifier maps speed onto the threshold bands", "[classifier]")
{
    const SpeedThresholds thresholds;

    CHECK(MotionClassifier::ClassifySpeed(0.0F, thresholds).kind == MotionKind::Idle);
    CHECK(MotionClassifier::ClassifySpeed(0.09F, thresholds).kind == MotionKind::Idle);
    CHECK(MotionClassifier::ClassifySpeed(0.1F, thresholds).kind == MotionKind::Walking);
    CHECK(MotionClassifier::ClassifySpeed(2.0F, thresholds).kind == MotionKind::Walking);

    const AnimationState running = MotionClassifier::ClassifySpeed(2.5F, thresholds);
    CHECK(running.kind == MotionKind::Running);
    CHECK(running.speed == Approx(2.5F));
}

TEST_CASE("Classifier ignores vertical velocity", "[classifier]")
{
    const BlendingConfig config;
    MotionClassifier classifier(config);

    CHECK(HorizontalSpeed(glm::vec3{3.0F, 100.0F, 4.0F}) == Approx(5.0F));

    const AnimationState state = classifier.Classify(std::nullopt, glm::vec3{3.0F, -20.0F, 4.0F});
    CHECK(state.kind == MotionKind::Running);
    CHECK(state.speed == Approx(5.0F));
    CHECK(classifier.Classify(std::nullopt, glm::vec3{0.0F, -9.0F, 0.0F}).kind == MotionKind::Idle);
}

TEST_CASE("Jump tag wins over speed, unknown tags fall back to Idle", "[classifier]")
{
    const BlendingConfig config;
    MotionClassifier classifier(config);

    CHECK(classifier.Classify(std::string("jump"), glm::vec3{0.0F}).kind == MotionKind::Jumping);
    CHECK(classifier.Classify(std::string("jump"), glm::vec3{9.0F, 0.0F, 0.0F}).kind == MotionKind::Jumping);

    CHECK(classifier.Classify(std::string("vault"), glm::vec3{6.0F, 0.0F, 0.0F}).kind == MotionKind::Idle);
    CHECK(classifier.Classify(std::string("vault"), glm::vec3{6.0F, 0.0F, 0.0F}).kind == MotionKind::Idle);
    CHECK(classifier.ReportedTagCount() == 1);

    CHECK(classifier.Classify(std::string("slide"), glm::vec3{0.0F}).kind == MotionKind::Idle);
    CHECK(classifier.ReportedTagCount() == 2);
}

TEST_CASE("Unknown tag reports are bounded per character", "[classifier]")
{
    const BlendingConfig config;
    MotionClassifier classifier(config);

    for (std::size_t i = 0; i < MotionClassifier::kMaxReportedTags + 8; ++i)
    {
        const std::string tag = "emote_" + std::to_string(i);
        CHECK(classifier.Classify(tag, glm::vec3{4.0F, 0.0F, 0.0F}).kind == MotionKind::Idle);
    }
    CHECK(classifier.ReportedTagCount() == MotionClassifier::kMaxReportedTags);

    // Tags past the bound still classify, and the jump tag is unaffected
    CHECK(classifier.Classify(std::string("emote_999"), glm::vec3{0.0F}).kind == MotionKind::Idle);
    CHECK(classifier.Classify(std::string("jump"), glm::vec3{0.0F}).kind == MotionKind::Jumping);
    CHECK(classifier.ReportedTagCount() == MotionClassifier::kMaxReportedTags);
}

TEST_CASE("Running speed changes keep the discriminant", "[state]")
{
    AnimatingState animating;

    const StateTransition first = animating.UpdateByDiscriminant(AnimationState::Running(3.0F));
    CHECK(first.directive == StateDirective::Alter);
    CHECK_FALSE(first.previous.has_value());

    CHECK(animating.UpdateByDiscriminant(AnimationState::Running(6.0F)).directive == StateDirective::Maintain);

    const StateTransition toJump = animating.UpdateByDiscriminant(AnimationState::Jumping());
    CHECK(toJump.directive == StateDirective::Alter);
    REQUIRE(toJump.previous.has_value());
    CHECK(toJump.previous->kind == MotionKind::Running);

    CHECK(AnimationState::Running(-1.0F).speed == 0.0F);
    CHECK(ToString(AnimationState::Running(3.5F)) == "Running(3.50)");
}

TEST_CASE("Foot phase always wraps into [0, 1)", "[blender][phase]")
{
    CHECK(AdvanceFootPhase(0.9F, 1.0F, 0.2F) == Approx(0.1F).margin(1.0e-5));
    CHECK(AdvanceFootPhase(0.0F, 2.0F, 0.25F) == Approx(0.5F));

    for (const float dt : {0.0F, 0.016F, 0.5F, 1.0F, 10.25F, 1000.0F})
    {
        const float phase = AdvanceFootPhase(0.75F, 2.3F, dt);
        CHECK(phase >= 0.0F);
        CHECK(phase < 1.0F);
    }

    CHECK(AdvanceFootPhase(0.5F, std::numeric_limits<float>::quiet_NaN(), 0.1F) == 0.0F);
    CHECK(AdvanceFootPhase(0.5F, std::numeric_limits<float>::infinity(), 0.1F) == 0.0F);
}

TEST_CASE("Cycle weights ramp linearly across each half cycle", "[blender][weights]")
{
    for (const float phase : {0.0F, 0.1F, 0.25F, 0.49F, 0.5F, 0.73F, 0.99F})
    {
        const auto weights = CyclePoseWeights(PoseId::WalkLeftFootForward, PoseId::WalkRightFootForward, phase);
        REQUIRE(weights.size() == 2);
        CHECK(weights[0].weight + weights[1].weight == Approx(1.0F).margin(1.0e-3));
    }

    const auto quarter = CyclePoseWeights(PoseId::WalkLeftFootForward, PoseId::WalkRightFootForward, 0.25F);
    CHECK(quarter[0].pose == PoseId::WalkLeftFootForward);
    CHECK(quarter[0].weight == Approx(0.5F));

    const auto start = CyclePoseWeights(PoseId::RunLeftFootForward, PoseId::RunRightFootForward, 0.0F);
    CHECK(start[0].pose == PoseId::RunLeftFootForward);
    CHECK(start[0].weight == Approx(1.0F));
}

TEST_CASE("Idle-movement and walk-run ramps are independent", "[blender][weights]")
{
    const SpeedThresholds thresholds;

    CHECK(MovementRamp(0.0F, thresholds) == 0.0F);
    CHECK(MovementRamp(1.05F, thresholds) == Approx(0.5F));
    CHECK(MovementRamp(50.0F, thresholds) == 1.0F);

    CHECK(WalkRunRamp(1.0F, thresholds) == 0.0F);
    CHECK(WalkRunRamp(5.0F, thresholds) == Approx(0.5F));
    CHECK(WalkRunRamp(50.0F, thresholds) == 1.0F);

    for (const float speed : {0.0F, 0.5F, 1.9F, 2.0F, 4.0F, 8.0F, 12.0F})
    {
        const LocomotionWeights weights = ComputeLocomotionWeights(speed, thresholds);
        CHECK(weights.Idle() + weights.Walk() + weights.Run() == Approx(1.0F).margin(1.0e-3));
    }
}

TEST_CASE("Cycle frequency grows with speed", "[blender][phase]")
{
    const BlendingConfig config;

    CHECK(CycleFrequency(MotionKind::Idle, 0.0F, config) == 0.0F);
    CHECK(CycleFrequency(MotionKind::Jumping, 5.0F, config) == 0.0F);
    CHECK(CycleFrequency(MotionKind::Walking, 0.1F, config) == Approx(1.0F));
    CHECK(CycleFrequency(MotionKind::Walking, 2.1F, config) == Approx(2.0F));
    CHECK(CycleFrequency(MotionKind::Running, 2.0F, config) == Approx(2.0F));
    CHECK(CycleFrequency(MotionKind::Running, 12.0F, config) == Approx(5.0F));
}

TEST_CASE("Blender keeps weight sums at one through a full run", "[blender][weights]")
{
    const BlendingConfig config;
    const PoseBlender blender(config);
    BlendTrack track;
    PoseBlendState blend;

    const float speeds[] = {0.0F, 1.0F, 1.5F, 3.0F, 7.0F, 9.0F, 0.5F, 0.0F};
    for (const float speed : speeds)
    {
        for (int i = 0; i < 30; ++i)
        {
            const AnimationState state = MotionClassifier::ClassifySpeed(speed, config.thresholds);
            blender.Tick(state, Moving(speed), 1.0F / 60.0F, track, blend);
            CHECK(blend.WeightSum() == Approx(1.0F).margin(1.0e-3));
            CHECK(blend.footPhase >= 0.0F);
            CHECK(blend.footPhase < 1.0F);
            CHECK(blend.strideLength >= 0.0F);
        }
    }
}

TEST_CASE("Idle selects a single pose and resets locomotion weights", "[blender]")
{
    const BlendingConfig config;
    const PoseBlender blender(config);
    BlendTrack track;
    PoseBlendState blend;

    blender.Tick(AnimationState::Walking(), Moving(1.5F), 0.1F, track, blend);
    CHECK(blend.locomotion.movement > 0.0F);

    blender.Tick(AnimationState::Idle(), Moving(0.0F), 0.1F, track, blend);
    REQUIRE(blend.activePoses.size() == 1);
    CHECK(blend.activePoses[0].pose == PoseId::Idle);
    CHECK(blend.activePoses[0].weight == 1.0F);
    CHECK(blend.locomotion.Idle() == 1.0F);
}

TEST_CASE("Maintain while running updates the walk-run mix", "[blender][weights]")
{
    const BlendingConfig config;
    const PoseBlender blender(config);
    BlendTrack track;
    PoseBlendState blend;

    blender.Tick(AnimationState::Running(3.0F), Moving(3.0F), 0.016F, track, blend);
    const float before = blend.locomotion.walkRun;

    const StateTransition transition = blender.Tick(AnimationState::Running(7.0F), Moving(7.0F), 0.016F, track, blend);
    CHECK(transition.directive == StateDirective::Maintain);
    CHECK(blend.locomotion.walkRun > before);
    CHECK(blend.locomotion.walkRun == Approx(5.0F / 6.0F));
}

TEST_CASE("Jump variant follows the state before the jump", "[blender][jump]")
{
    const BlendingConfig config;
    const PoseBlender blender(config);

    SECTION("from a standstill")
    {
        BlendTrack track;
        PoseBlendState blend;
        blender.Tick(AnimationState::Idle(), Moving(0.0F), 0.016F, track, blend);
        blender.Tick(AnimationState::Jumping(), Moving(0.0F), 0.016F, track, blend);

        REQUIRE(blend.jump.has_value());
        CHECK(blend.jump->priorKind == MotionKind::Idle);
        CHECK(blend.jump->Variant() == LocomotionClip::StandingJump);
        CHECK(blend.jump->OtherVariant() == LocomotionClip::RunningJump);
        REQUIRE(blend.activePoses.size() == 1);
        CHECK(blend.activePoses[0].pose == PoseId::JumpTakeoff);
    }

    SECTION("while moving")
    {
        BlendTrack track;
        PoseBlendState blend;
        blender.Tick(AnimationState::Walking(), Moving(1.5F), 0.016F, track, blend);
        blender.Tick(AnimationState::Jumping(), Moving(1.5F), 0.016F, track, blend);

        REQUIRE(blend.jump.has_value());
        CHECK(blend.jump->wasMoving);
        CHECK(blend.jump->Variant() == LocomotionClip::RunningJump);
    }

    SECTION("as the very first state")
    {
        BlendTrack track;
        PoseBlendState blend;
        blender.Tick(AnimationState::Jumping(), Moving(4.0F), 0.016F, track, blend);

        REQUIRE(blend.jump.has_value());
        CHECK(blend.jump->Variant() == LocomotionClip::StandingJump);
    }

    SECTION("landing clears the jump context")
    {
        BlendTrack track;
        PoseBlendState blend;
        blender.Tick(AnimationState::Running(4.0F), Moving(4.0F), 0.016F, track, blend);
        blender.Tick(AnimationState::Jumping(), Moving(4.0F), 0.016F, track, blend);
        blender.Tick(AnimationState::Running(4.0F), Moving(4.0F), 0.016F, track, blend);
        CHECK_FALSE(blend.jump.has_value());
    }
}

TEST_CASE("Contact state goes Airborne then Landing for the landing window", "[blender][contact]")
{
    BlendingConfig config;
    config.landingDuration = 0.15F;
    const PoseBlender blender(config);
    BlendTrack track;
    PoseBlendState blend;

    blender.Tick(AnimationState::Jumping(), Moving(0.0F, false), 0.05F, track, blend);
    CHECK(blend.contactState == ContactState::Airborne);
    CHECK(blend.activePoses[0].pose == PoseId::JumpAirborne);

    blender.Tick(AnimationState::Idle(), Moving(0.0F, true), 0.1F, track, blend);
    CHECK(blend.contactState == ContactState::Landing);
    CHECK(blend.activePoses[0].pose == PoseId::JumpLanding);

    blender.Tick(AnimationState::Idle(), Moving(0.0F, true), 0.1F, track, blend);
    CHECK(blend.contactState == ContactState::Landing);

    blender.Tick(AnimationState::Idle(), Moving(0.0F, true), 0.1F, track, blend);
    CHECK(blend.contactState == ContactState::Grounded);
    CHECK(blend.activePoses[0].pose == PoseId::Idle);
}

TEST_CASE("Foot phase holds while airborne", "[blender][phase]")
{
    const BlendingConfig config;
    const PoseBlender blender(config);
    BlendTrack track;
    PoseBlendState blend;

    blender.Tick(AnimationState::Walking(), Moving(1.5F), 0.1F, track, blend);
    const float phase = blend.footPhase;
    blender.Tick(AnimationState::Walking(), Moving(1.5F, false), 0.1F, track, blend);
    CHECK(blend.footPhase == phase);
}

TEST_CASE("Stride length follows speed and shortens on slopes", "[stride]")
{
    const StrideCalculator stride(StrideSettings{}, SpeedThresholds{});
    const glm::vec3 up{0.0F, 1.0F, 0.0F};

    CHECK(stride.StrideLength(0.0F, up) == 0.0F);
    CHECK(stride.StrideLength(1.0F, up) == Approx(0.3F));
    CHECK(stride.StrideLength(2.0F, up) == Approx(0.6F));
    CHECK(stride.StrideLength(5.0F, up) == Approx(0.9F));
    CHECK(stride.StrideLength(8.0F, up) == Approx(1.2F));
    CHECK(stride.StrideLength(20.0F, up) == Approx(1.2F));

    const glm::vec3 slope = glm::normalize(glm::vec3{0.0F, 1.0F, 1.0F});
    CHECK(stride.StrideLength(8.0F, slope) < 1.2F);
    CHECK(SlopeStrideAdjustment(up) == 1.0F);
    CHECK(SlopeStrideAdjustment(glm::vec3{1.0F, 0.0F, 0.0F}) == Approx(0.7F));
    CHECK(SlopeStrideAdjustment(slope) >= 0.7F);
}

TEST_CASE("Foot targets straddle the travel direction", "[stride]")
{
    const StrideCalculator stride(StrideSettings{}, SpeedThresholds{});
    const glm::vec3 origin{0.0F};
    const glm::vec3 velocity{0.0F, 0.0F, -2.0F};

    const glm::vec3 left = stride.FootTarget(origin, velocity, 1.0F, 0.5F, true);
    const glm::vec3 right = stride.FootTarget(origin, velocity, 1.0F, 0.5F, false);

    CHECK(std::abs(left.x) == Approx(kFootLateralOffset));
    CHECK(std::abs(right.x) == Approx(kFootLateralOffset));
    CHECK(left.x == Approx(-right.x));
    CHECK(left.z == Approx(0.0F).margin(1.0e-5));
    CHECK(right.z == Approx(0.5F));
}
