#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cge/game/action_system.hpp"
#include "cge/game/character.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/rule_engine.hpp"

using namespace cge::game;
using cge::foundation::ErrorCode;

namespace {

class ActionSystemTest : public ::testing::Test {
protected:
    Character makeCharacter(int32_t talent = 5) {
        return Character::Create("Lin", talent, difficulty_, rules_.Rules()).value();
    }

    RuleEngine rules_;
    DifficultySettings difficulty_ = NormalDifficulty();
    ActionSystem actions_{rules_, difficulty_};
};

}  // namespace

// =============================================================================
// Catalogue and parsing
// =============================================================================

TEST(ActionTypesTest, ParseKnownIds) {
    auto cultivate = ParseActionId("cultivate");
    ASSERT_TRUE(cultivate.hasValue());
    EXPECT_EQ(KindOf(cultivate.value()), ActionKind::Cultivate);
    EXPECT_EQ(KindOf(ParseActionId("consume_pill").value()), ActionKind::ConsumePill);
}

TEST(ActionTypesTest, ParseUnknownId) {
    auto result = ParseActionId("fly");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownAction);
}

TEST(ActionTypesTest, CatalogueMatchesKinds) {
    for (std::size_t i = 0; i < kActionKindCount; ++i) {
        auto kind = static_cast<ActionKind>(i);
        EXPECT_EQ(GetActionInfo(kind).kind, kind);
        EXPECT_EQ(KindOf(MakeAction(kind)), kind);
    }
    EXPECT_EQ(GetActionInfo(ActionKind::Meditate).displayName, "打坐");
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ActionSystemTest, TerminalPhasesRejectEverything) {
    auto character = makeCharacter();
    for (auto phase : {SessionPhase::GameOver, SessionPhase::Ascended}) {
        auto result = actions_.Validate(Wait{}, phase, character);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidPhase);
    }
}

TEST_F(ActionSystemTest, PillRequiresStock) {
    auto character = makeCharacter();
    ASSERT_TRUE(character.Inventory().Consume(1).hasValue());

    auto result = actions_.Validate(ConsumePill{}, SessionPhase::Active, character);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientResource);
}

TEST_F(ActionSystemTest, CultivateRequiresMana) {
    auto character = makeCharacter();
    character.Mana().ApplyDelta(-35);  // 15 left, cost is 20

    auto result = actions_.Validate(Cultivate{}, SessionPhase::Active, character);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientResource);
}

TEST_F(ActionSystemTest, FullResourcesNeverBlock) {
    auto character = makeCharacter();
    character.Mana().ApplyDelta(100);
    ASSERT_TRUE(character.Health().IsFull());
    ASSERT_TRUE(character.Mana().IsFull());

    EXPECT_TRUE(actions_.Validate(Meditate{}, SessionPhase::Active, character).hasValue());
    EXPECT_TRUE(actions_.Validate(ConsumePill{}, SessionPhase::Active, character).hasValue());
}

// =============================================================================
// Application
// =============================================================================

TEST_F(ActionSystemTest, MeditateAtFullHealthIsNoOpOnHealth) {
    auto character = makeCharacter();
    auto outcome = actions_.Apply(Meditate{}, character);
    ASSERT_TRUE(outcome.hasValue());

    EXPECT_EQ(outcome.value().healthDelta, 0);
    EXPECT_EQ(outcome.value().manaDelta, 13);
    EXPECT_EQ(character.Mana().Current(), 63);
    EXPECT_EQ(character.MeditationStreak(), 1u);
    EXPECT_EQ(character.TotalActions(), 1u);
}

TEST_F(ActionSystemTest, MeditateReportsClampedDelta) {
    auto character = makeCharacter();
    character.Mana().ApplyDelta(45);  // 95 of 100

    auto outcome = actions_.Apply(Meditate{}, character);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().manaDelta, 5);
    EXPECT_TRUE(character.Mana().IsFull());
}

TEST_F(ActionSystemTest, ConsumePillRestoresAndDecrements) {
    auto character = makeCharacter();
    character.Health().ApplyDelta(-50);

    auto outcome = actions_.Apply(ConsumePill{}, character);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().healthDelta, 20);
    EXPECT_EQ(outcome.value().manaDelta, 20);
    EXPECT_EQ(outcome.value().pillsConsumed, 1u);
    EXPECT_EQ(outcome.value().pillsRemaining, 0u);
    EXPECT_EQ(character.Inventory().PillCount(), 0u);
    EXPECT_EQ(character.MeditationStreak(), 0u);
}

TEST_F(ActionSystemTest, ApplyRechecksPreconditions) {
    auto character = makeCharacter();
    ASSERT_TRUE(character.Inventory().Consume(1).hasValue());

    auto outcome = actions_.Apply(ConsumePill{}, character);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::InsufficientResource);
    EXPECT_EQ(character.TotalActions(), 0u);
}

TEST_F(ActionSystemTest, CultivateSpendsManaForExperience) {
    auto character = makeCharacter();
    auto outcome = actions_.Apply(Cultivate{}, character);
    ASSERT_TRUE(outcome.hasValue());

    EXPECT_EQ(outcome.value().manaDelta, -20);
    EXPECT_EQ(outcome.value().experienceDelta, 19);
    EXPECT_TRUE(outcome.value().breakthroughs.empty());
    EXPECT_EQ(character.Experience().Total(), 19);
    EXPECT_EQ(character.Mana().Current(), 30);
}

TEST_F(ActionSystemTest, CultivateUsesStreakBeforeReset) {
    auto character = makeCharacter();
    ASSERT_TRUE(actions_.Apply(Meditate{}, character).hasValue());

    auto outcome = actions_.Apply(Cultivate{}, character);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().experienceDelta, 21);
    EXPECT_EQ(character.MeditationStreak(), 0u);
}

TEST_F(ActionSystemTest, LargeGainReportsEveryBreakthrough) {
    difficulty_.experienceMultiplier = 20.0;
    auto character = makeCharacter();

    auto outcome = actions_.Apply(Cultivate{}, character);
    ASSERT_TRUE(outcome.hasValue());
    std::vector<Stage> expected = {Stage::Foundation, Stage::CoreFormation};
    EXPECT_EQ(outcome.value().breakthroughs, expected);
    EXPECT_EQ(character.CurrentStage(), Stage::CoreFormation);
    EXPECT_FALSE(outcome.value().reachedTerminalStage);
}

TEST_F(ActionSystemTest, ReachingTerminalStageIsFlagged) {
    difficulty_.experienceMultiplier = 200.0;
    auto character = makeCharacter();

    auto outcome = actions_.Apply(Cultivate{}, character);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().breakthroughs.size(), 5u);
    EXPECT_TRUE(outcome.value().reachedTerminalStage);
}

TEST_F(ActionSystemTest, WaitOnlyCountsAction) {
    auto character = makeCharacter();
    ASSERT_TRUE(actions_.Apply(Meditate{}, character).hasValue());
    auto before = character.Status();

    auto outcome = actions_.Apply(Wait{}, character);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().healthDelta, 0);
    EXPECT_EQ(outcome.value().manaDelta, 0);
    EXPECT_EQ(character.Mana().Current(), before.mana);
    EXPECT_EQ(character.MeditationStreak(), 0u);
    EXPECT_EQ(character.TotalActions(), before.totalActions + 1);
}

TEST(ActionSystemHealthCostTest, UpkeepCanKill) {
    RuleSet set;
    set.actionHealthCost[static_cast<std::size_t>(ActionKind::Wait)] = 60;
    RuleEngine rules(set);
    auto difficulty = NormalDifficulty();
    ActionSystem actions(rules, difficulty);
    auto character = Character::Create("Lin", 5, difficulty, set).value();

    auto first = actions.Apply(Wait{}, character);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value().healthCost, 60);
    EXPECT_EQ(first.value().healthDelta, -60);
    EXPECT_FALSE(first.value().died);

    auto second = actions.Apply(Wait{}, character);
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value().healthCost, 40);
    EXPECT_TRUE(second.value().died);
    EXPECT_EQ(character.Health().Current(), 0);
}

TEST(ActionSystemDescribeTest, SummariesNameTheEffect) {
    ActionOutcome outcome;
    outcome.kind = ActionKind::Cultivate;
    outcome.manaDelta = -20;
    outcome.experienceDelta = 19;
    EXPECT_EQ(ActionSystem::Describe(outcome), "Cultivated, spending 20 mana for 19 experience.");

    ActionOutcome idle;
    idle.kind = ActionKind::Meditate;
    EXPECT_NE(ActionSystem::Describe(idle).find("nothing restored"), std::string::npos);
}
