#include <gtest/gtest.h>

#include <optional>

#include "abp/behavior/behavior_controller.hpp"
#include "abp/world/seat_board.hpp"

using namespace abp::behavior;
using abp::foundation::ConfigManager;
using abp::foundation::EntityId;
using abp::foundation::ErrorCode;
using abp::world::SeatBoard;

namespace {

/// Resolver returning a fixed destination (or none) for every step.
class FixedResolver : public ITargetResolver {
public:
    std::optional<ResolvedTarget> Resolve(EntityId /*entity*/, const PlanStep& step) override {
        ++calls;
        lastSeatIndex = step.seatIndex;
        if (refusedKind == step.kind) {
            return std::nullopt;
        }
        return result;
    }

    std::optional<ResolvedTarget> result = ResolvedTarget{{1.0f, 2.0f}, {"sit", 0.5f, 0.4f}};
    std::optional<StepKind> refusedKind;
    int calls = 0;
    std::optional<uint32_t> lastSeatIndex;
};

}  // namespace

// ===========================================================================
// LoadPlannerSettings
// ===========================================================================

TEST(PlannerSettingsTest, DefaultsWhenAbsent) {
    ConfigManager config;
    auto settings = LoadPlannerSettings(config);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_EQ(settings.value().stepCountRange.min, 2u);
    EXPECT_EQ(settings.value().stepCountRange.max, 5u);
    EXPECT_FLOAT_EQ(settings.value().stageReactionProbability, 0.6f);
    EXPECT_EQ(settings.value().seed, 0u);
}

TEST(PlannerSettingsTest, ReadsPlannerSection) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
planner:
  min_steps: 3
  max_steps: 4
  stage_reaction_probability: 0.25
  seed: 77
)").hasValue());

    auto settings = LoadPlannerSettings(config);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_EQ(settings.value().stepCountRange.min, 3u);
    EXPECT_EQ(settings.value().stepCountRange.max, 4u);
    EXPECT_FLOAT_EQ(settings.value().stageReactionProbability, 0.25f);
    EXPECT_EQ(settings.value().seed, 77u);
}

TEST(PlannerSettingsTest, RejectsBadStepRange) {
    ConfigManager zero;
    ASSERT_TRUE(zero.loadFromString("planner: {min_steps: 0}").hasValue());
    auto zeroResult = LoadPlannerSettings(zero);
    ASSERT_TRUE(zeroResult.hasError());
    EXPECT_EQ(zeroResult.error().code(), ErrorCode::InvalidStepCountRange);
    EXPECT_EQ(zeroResult.error().key(), "planner.min_steps");

    ConfigManager reversed;
    ASSERT_TRUE(reversed.loadFromString("planner: {min_steps: 6, max_steps: 3}").hasValue());
    auto reversedResult = LoadPlannerSettings(reversed);
    ASSERT_TRUE(reversedResult.hasError());
    EXPECT_EQ(reversedResult.error().code(), ErrorCode::InvalidStepCountRange);
}

TEST(PlannerSettingsTest, RejectsProbabilityOutsideUnitInterval) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("planner: {stage_reaction_probability: 1.5}").hasValue());
    auto result = LoadPlannerSettings(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidProbability);
    EXPECT_EQ(result.error().key(), "planner.stage_reaction_probability");
}

TEST(PlannerSettingsTest, PropagatesTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("planner: {seed: lucky}").hasValue());
    auto result = LoadPlannerSettings(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ===========================================================================
// BehaviorController
// ===========================================================================

class BehaviorControllerTest : public ::testing::Test {
protected:
    /// Couch-only profile with two-step plans: the first step is always the
    /// couch and the second falls back to wandering.
    BehaviorController makeController(float stageProbability = 0.0f,
                                      EntityId entity = EntityId(1)) {
        PlannerSettings settings;
        settings.stepCountRange = {2, 2};
        settings.stageReactionProbability = stageProbability;
        settings.seed = 11;
        return BehaviorController(entity, PersonalityWeights{{StepKind::SitOnCouch, 1.0f}},
                                  generator_, board_, resolver_, settings);
    }

    static TickInput at(float now) {
        TickInput input;
        input.now = now;
        return input;
    }

    PlanGenerator generator_;
    SeatBoard board_;
    FixedResolver resolver_;
};

TEST_F(BehaviorControllerTest, WalksDwellsThenAdvances) {
    auto npc = makeController();

    auto first = npc.Tick(at(0.0f));
    EXPECT_EQ(first.action, DriverAction::MoveToTarget);
    EXPECT_EQ(first.kind, StepKind::SitOnCouch);
    EXPECT_EQ(first.target, (Position{1.0f, 2.0f}));
    EXPECT_EQ(first.cue.animation, "sit");
    EXPECT_EQ(first.thought, "wandering");

    // Target is resolved once per step.
    EXPECT_EQ(npc.Tick(at(0.5f)).action, DriverAction::MoveToTarget);
    EXPECT_EQ(resolver_.calls, 1);

    npc.NotifyArrived(1.0f);
    EXPECT_TRUE(npc.HasArrived());
    EXPECT_EQ(npc.Tick(at(2.0f)).action, DriverAction::Dwell);

    // Couch steps last at most 20 seconds.
    auto done = npc.Tick(at(30.0f));
    EXPECT_EQ(done.action, DriverAction::Idle);
    EXPECT_FALSE(npc.HasArrived());

    auto next = npc.Tick(at(30.5f));
    EXPECT_EQ(next.action, DriverAction::MoveToTarget);
    EXPECT_EQ(next.kind, StepKind::Wander);
}

TEST_F(BehaviorControllerTest, SeatHeldWhileStepRuns) {
    auto npc = makeController();
    npc.Tick(at(0.0f));

    EXPECT_EQ(npc.ClaimedArea(), SeatArea::Couch);
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 1u);
    ASSERT_TRUE(resolver_.lastSeatIndex.has_value());
    EXPECT_EQ(board_.SeatHolder(SeatArea::Couch, *resolver_.lastSeatIndex), EntityId(1));

    npc.NotifyArrived(0.0f);
    npc.Tick(at(30.0f));
    EXPECT_FALSE(npc.ClaimedArea().has_value());
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);
}

TEST_F(BehaviorControllerTest, FullAreaSkipsStep) {
    auto npc = makeController();
    npc.Executor().NewPlan();
    ASSERT_EQ(npc.Executor().CurrentKind(), StepKind::SitOnCouch);

    board_.ClaimSeat(SeatArea::Couch, EntityId(100));
    board_.ClaimSeat(SeatArea::Couch, EntityId(101));

    auto skipped = npc.Tick(at(0.0f));
    EXPECT_EQ(skipped.action, DriverAction::Idle);
    EXPECT_EQ(resolver_.calls, 0);
    EXPECT_EQ(npc.Executor().CurrentKind(), StepKind::Wander);

    EXPECT_EQ(npc.Tick(at(0.1f)).kind, StepKind::Wander);
}

TEST_F(BehaviorControllerTest, UnresolvedTargetReleasesSeatAndSkips) {
    resolver_.result.reset();
    auto npc = makeController();

    auto directive = npc.Tick(at(0.0f));
    EXPECT_EQ(directive.action, DriverAction::Idle);
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);
    EXPECT_FALSE(npc.ClaimedArea().has_value());
    EXPECT_EQ(npc.Executor().CurrentKind(), StepKind::Wander);
}

TEST_F(BehaviorControllerTest, ConversationPausesAndRequiresReArrival) {
    auto npc = makeController();
    npc.Tick(at(0.0f));
    npc.NotifyArrived(1.0f);
    ASSERT_EQ(npc.Tick(at(2.0f)).action, DriverAction::Dwell);

    TickInput talking = at(3.0f);
    talking.inConversation = true;
    auto paused = npc.Tick(talking);
    EXPECT_EQ(paused.action, DriverAction::Idle);
    EXPECT_FALSE(paused.kind.has_value());
    EXPECT_TRUE(npc.Executor().IsPaused());

    auto resumed = npc.Tick(at(100.0f));
    EXPECT_FALSE(npc.Executor().IsPaused());
    EXPECT_EQ(resumed.action, DriverAction::MoveToTarget);
    EXPECT_EQ(resumed.kind, StepKind::SitOnCouch);
    EXPECT_FALSE(npc.HasArrived());

    // The full duration is served again after re-arrival.
    npc.NotifyArrived(100.0f);
    EXPECT_EQ(npc.Tick(at(101.0f)).action, DriverAction::Dwell);
}

TEST_F(BehaviorControllerTest, CommandOverridesPlan) {
    auto npc = makeController();
    npc.Tick(at(0.0f));
    npc.NotifyArrived(0.5f);
    ASSERT_EQ(board_.Occupancy(SeatArea::Couch), 1u);

    TickInput command = at(1.0f);
    command.command = StepKind::PlayOutdoorSportB;
    auto directive = npc.Tick(command);

    EXPECT_EQ(directive.action, DriverAction::MoveToTarget);
    EXPECT_EQ(directive.kind, StepKind::PlayOutdoorSportB);
    EXPECT_EQ(directive.thought, "playing_golf");
    EXPECT_TRUE(npc.Executor().IsOverridden());
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);
    EXPECT_FALSE(npc.HasArrived());
}

TEST_F(BehaviorControllerTest, OverrideIgnoresConversationAndStage) {
    auto npc = makeController(1.0f);
    TickInput command = at(0.0f);
    command.command = StepKind::Present;
    npc.Tick(command);

    TickInput busy = at(1.0f);
    busy.inConversation = true;
    busy.stagePerformer = EntityId(9);
    auto directive = npc.Tick(busy);

    EXPECT_EQ(directive.action, DriverAction::MoveToTarget);
    EXPECT_EQ(directive.kind, StepKind::Present);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
}

TEST_F(BehaviorControllerTest, StagePerformanceInterruptsAndRestores) {
    auto npc = makeController(1.0f);
    npc.Tick(at(0.0f));
    ASSERT_EQ(board_.Occupancy(SeatArea::Couch), 1u);

    TickInput show = at(1.0f);
    show.stagePerformer = EntityId(9);
    auto watching = npc.Tick(show);
    EXPECT_EQ(watching.action, DriverAction::MoveToTarget);
    EXPECT_EQ(watching.kind, StepKind::WatchStage);
    EXPECT_EQ(watching.thought, "watching_stage");
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);

    npc.NotifyArrived(2.0f);
    show.now = 500.0f;
    EXPECT_EQ(npc.Tick(show).action, DriverAction::Dwell);

    auto back = npc.Tick(at(501.0f));
    EXPECT_EQ(back.action, DriverAction::MoveToTarget);
    EXPECT_EQ(back.kind, StepKind::SitOnCouch);
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 1u);
    EXPECT_EQ(npc.ClaimedArea(), SeatArea::Couch);
}

TEST_F(BehaviorControllerTest, PerformerChangeWhileWatchingKeepsSavedPlan) {
    auto npc = makeController(1.0f);
    npc.Tick(at(0.0f));

    TickInput show = at(1.0f);
    show.stagePerformer = EntityId(9);
    npc.Tick(show);
    ASSERT_TRUE(npc.Executor().HasSavedPlan());

    show.now = 2.0f;
    show.stagePerformer = EntityId(10);
    EXPECT_EQ(npc.Tick(show).kind, StepKind::WatchStage);
    EXPECT_TRUE(npc.Executor().HasSavedPlan());

    auto back = npc.Tick(at(3.0f));
    EXPECT_EQ(back.kind, StepKind::SitOnCouch);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 1u);
}

TEST_F(BehaviorControllerTest, UnreachableStageRestoresSavedPlan) {
    resolver_.refusedKind = StepKind::WatchStage;
    auto npc = makeController(1.0f);
    npc.Tick(at(0.0f));
    ASSERT_EQ(board_.Occupancy(SeatArea::Couch), 1u);

    TickInput show = at(1.0f);
    show.stagePerformer = EntityId(99);
    auto skipped = npc.Tick(show);
    EXPECT_EQ(skipped.action, DriverAction::Idle);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
    EXPECT_EQ(npc.Executor().CurrentKind(), StepKind::SitOnCouch);
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);

    show.now = 2.0f;
    auto back = npc.Tick(show);
    EXPECT_EQ(back.action, DriverAction::MoveToTarget);
    EXPECT_EQ(back.kind, StepKind::SitOnCouch);
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 1u);
}

TEST_F(BehaviorControllerTest, SeatBookkeepingSurvivesRepeatedPerformances) {
    resolver_.refusedKind = StepKind::WatchStage;
    auto npc = makeController(1.0f);
    npc.Tick(at(0.0f));

    TickInput first = at(1.0f);
    first.stagePerformer = EntityId(99);
    npc.Tick(first);
    first.now = 2.0f;
    npc.Tick(first);
    npc.NotifyArrived(2.0f);
    ASSERT_EQ(npc.Tick(at(3.0f)).action, DriverAction::Dwell);

    TickInput second = at(4.0f);
    second.stagePerformer = EntityId(77);
    npc.Tick(second);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), npc.ClaimedArea() ? 1u : 0u);

    second.now = 5.0f;
    auto directive = npc.Tick(second);
    EXPECT_EQ(directive.kind, StepKind::SitOnCouch);
    EXPECT_EQ(npc.ClaimedArea(), SeatArea::Couch);
    ASSERT_TRUE(resolver_.lastSeatIndex.has_value());
    EXPECT_EQ(board_.SeatHolder(SeatArea::Couch, *resolver_.lastSeatIndex), EntityId(1));
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 1u);
}

TEST_F(BehaviorControllerTest, ZeroReactionProbabilityKeepsPlan) {
    auto npc = makeController(0.0f);
    npc.Tick(at(0.0f));

    TickInput show = at(1.0f);
    show.stagePerformer = EntityId(9);
    EXPECT_EQ(npc.Tick(show).kind, StepKind::SitOnCouch);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
}

TEST_F(BehaviorControllerTest, OwnPerformanceDoesNotInterrupt) {
    auto npc = makeController(1.0f, EntityId(7));
    npc.Tick(at(0.0f));

    TickInput show = at(1.0f);
    show.stagePerformer = EntityId(7);
    EXPECT_EQ(npc.Tick(show).kind, StepKind::SitOnCouch);
    EXPECT_FALSE(npc.Executor().HasSavedPlan());
}

TEST_F(BehaviorControllerTest, BlockedMovementSkipsStep) {
    auto npc = makeController();
    npc.Tick(at(0.0f));

    npc.NotifyBlocked();
    EXPECT_EQ(board_.Occupancy(SeatArea::Couch), 0u);
    EXPECT_EQ(npc.Executor().CurrentKind(), StepKind::Wander);
    EXPECT_EQ(npc.Tick(at(0.1f)).kind, StepKind::Wander);
}

TEST_F(BehaviorControllerTest, ArrivalBeforeTargetIsIgnored) {
    auto npc = makeController();
    npc.NotifyArrived(0.0f);
    EXPECT_FALSE(npc.HasArrived());

    npc.Executor().NewPlan();
    npc.NotifyArrived(0.0f);
    EXPECT_FALSE(npc.HasArrived());
}
