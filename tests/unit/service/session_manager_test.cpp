#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cge/foundation/error_code.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/rule_engine.hpp"
#include "cge/service/session_manager.hpp"

using namespace cge::service;
using namespace cge::game;
using cge::foundation::ErrorCode;

// =============================================================================
// Test fixture
// =============================================================================

class SessionManagerTest : public ::testing::Test {
protected:
    static SessionOptions talent(int32_t value) {
        SessionOptions options;
        options.characterName = "Lin";
        options.talent = value;
        return options;
    }

    static DifficultySettings preset(const char* id) { return FindDifficulty(id).value(); }

    /// Normal difficulty with a boosted experience multiplier.
    static DifficultySettings boosted(double multiplier) {
        auto difficulty = NormalDifficulty();
        difficulty.id = "boosted";
        difficulty.experienceMultiplier = multiplier;
        return difficulty;
    }

    ActionResult apply(SessionManager& manager, const Action& action) {
        auto result = manager.applyAction(action);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : ActionResult{};
    }

    static std::vector<EventKind> kinds(const std::vector<LogEntry>& entries) {
        std::vector<EventKind> out;
        for (const auto& e : entries) {
            out.push_back(e.kind);
        }
        return out;
    }

    SessionManager manager_;
};

// =============================================================================
// Session creation
// =============================================================================

TEST_F(SessionManagerTest, NoSessionInitially) {
    EXPECT_FALSE(manager_.hasSession());
    EXPECT_FALSE(manager_.sessionId().has_value());
    EXPECT_TRUE(manager_.availableActions().empty());
    EXPECT_TRUE(manager_.logEntries().empty());

    auto snap = manager_.snapshot();
    ASSERT_TRUE(snap.hasError());
    EXPECT_EQ(snap.error().code(), ErrorCode::SessionNotStarted);

    auto result = manager_.applyAction(Wait{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SessionNotStarted);
}

TEST_F(SessionManagerTest, CreateSessionBuildsFreshCharacter) {
    auto view = manager_.createSession(NormalDifficulty(), talent(5));
    ASSERT_TRUE(view.hasValue());

    const auto& status = view.value();
    EXPECT_EQ(status.phase, SessionPhase::Active);
    EXPECT_EQ(status.difficultyName, "普通");
    EXPECT_EQ(status.characterName, "Lin");
    EXPECT_EQ(status.talent, 5);
    EXPECT_EQ(status.health, 100);
    EXPECT_EQ(status.maxHealth, 100);
    EXPECT_EQ(status.mana, 50);
    EXPECT_EQ(status.pills, 1u);
    EXPECT_EQ(status.totalExperience, 0);
    EXPECT_EQ(status.stage, Stage::QiRefining);
    EXPECT_EQ(status.stageDisplayName, "炼气期");
    ASSERT_TRUE(status.nextThreshold.has_value());
    EXPECT_EQ(*status.nextThreshold, 100);
    EXPECT_TRUE(status.alive);
    EXPECT_EQ(status.powerRating, 100);

    // Welcome and talent entries.
    ASSERT_EQ(status.recentEntries.size(), 2u);
    EXPECT_EQ(status.recentEntries[0].kind, EventKind::SessionStarted);
    EXPECT_EQ(status.recentEntries[0].sequence, 1u);
    EXPECT_EQ(status.recentEntries[1].payload->at("talent"), 5);
}

TEST_F(SessionManagerTest, DefaultCharacterName) {
    SessionOptions options;
    options.talent = 2;
    auto view = manager_.createSession(NormalDifficulty(), options);
    ASSERT_TRUE(view.hasValue());
    EXPECT_EQ(view.value().characterName, "无名修士");
}

TEST_F(SessionManagerTest, TalentOverrideOutsideRangeRejected) {
    auto result = manager_.createSession(preset("easy"), talent(2));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(manager_.hasSession());
}

TEST_F(SessionManagerTest, InvalidDifficultyRejectedAtCreation) {
    auto broken = NormalDifficulty();
    broken.talentRange = {9, 2};
    auto result = manager_.createSession(broken);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(SessionManagerTest, InvalidRulesRejectedAtCreation) {
    RuleSet rules;
    rules.maxHealth = 0;
    SessionManager manager(rules);

    auto result = manager.createSession(NormalDifficulty(), talent(5));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(manager.hasSession());
}

TEST_F(SessionManagerTest, SeededTalentIsReproducibleAndInRange) {
    SessionOptions options;
    options.seed = 12345;

    SessionManager other;
    auto a = manager_.createSession(preset("hard"), options);
    auto b = other.createSession(preset("hard"), options);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_EQ(a.value().talent, b.value().talent);

    for (uint64_t seed = 1; seed <= 50; ++seed) {
        options.seed = seed;
        auto view = manager_.createSession(preset("hard"), options);
        ASSERT_TRUE(view.hasValue());
        EXPECT_GE(view.value().talent, 1);
        EXPECT_LE(view.value().talent, 6);
    }
}

// =============================================================================
// Scenario: deterministic cultivation
// =============================================================================

TEST_F(SessionManagerTest, CultivationGainIsReproducible) {
    std::vector<int64_t> gains;
    for (int run = 0; run < 3; ++run) {
        ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
        auto result = apply(manager_, Cultivate{});
        ASSERT_TRUE(result.accepted);
        ASSERT_TRUE(result.outcome.has_value());
        gains.push_back(result.outcome->experienceDelta);
        EXPECT_EQ(result.status.totalExperience, result.outcome->experienceDelta);
    }
    EXPECT_EQ(gains[0], 19);
    EXPECT_EQ(gains[1], gains[0]);
    EXPECT_EQ(gains[2], gains[0]);
}

TEST_F(SessionManagerTest, AppliedEntryCarriesPayload) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    auto result = apply(manager_, Meditate{});

    ASSERT_EQ(result.entries.size(), 1u);
    const auto& entry = result.entries[0];
    EXPECT_EQ(entry.kind, EventKind::ActionApplied);
    EXPECT_EQ(entry.sequence, 3u);
    ASSERT_TRUE(entry.payload.has_value());
    EXPECT_EQ(entry.payload->at("health_delta"), 0);
    EXPECT_EQ(entry.payload->at("mana_delta"), 13);
    EXPECT_EQ(entry.payload->at("mana"), 63);
    EXPECT_EQ(result.summary, entry.message);
}

// =============================================================================
// Scenario: rejected consumption
// =============================================================================

TEST_F(SessionManagerTest, PillWithoutStockIsRejected) {
    ASSERT_TRUE(manager_.createSession(preset("hard"), talent(3)).hasValue());
    auto before = manager_.snapshot().value();
    auto logBefore = manager_.logEntries().size();

    auto result = apply(manager_, ConsumePill{});
    EXPECT_FALSE(result.accepted);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), ErrorCode::InsufficientResource);
    EXPECT_FALSE(result.outcome.has_value());

    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].kind, EventKind::ActionRejected);
    EXPECT_EQ(manager_.logEntries().size(), logBefore + 1);

    const auto& after = result.status;
    EXPECT_EQ(after.health, before.health);
    EXPECT_EQ(after.mana, before.mana);
    EXPECT_EQ(after.pills, 0u);
    EXPECT_EQ(after.totalExperience, before.totalExperience);
    EXPECT_EQ(after.totalActions, before.totalActions);
    EXPECT_EQ(after.phase, SessionPhase::Active);

    EXPECT_EQ(manager_.statistics().value().rejectedActions, 1u);
}

TEST_F(SessionManagerTest, CultivationStopsWhenManaRunsOut) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());

    EXPECT_TRUE(apply(manager_, Cultivate{}).accepted);   // 50 -> 30
    EXPECT_TRUE(apply(manager_, Cultivate{}).accepted);   // 30 -> 10
    auto third = apply(manager_, Cultivate{});
    EXPECT_FALSE(third.accepted);
    ASSERT_TRUE(third.error.has_value());
    EXPECT_EQ(third.error->code(), ErrorCode::InsufficientResource);
    EXPECT_EQ(third.status.mana, 10);
    EXPECT_EQ(third.status.totalExperience, 38);
}

// =============================================================================
// Scenario: multiple breakthroughs in one action
// =============================================================================

TEST_F(SessionManagerTest, OneCultivationCrossingTwoStages) {
    ASSERT_TRUE(manager_.createSession(boosted(20.0), talent(5)).hasValue());

    auto result = apply(manager_, Cultivate{});
    ASSERT_TRUE(result.accepted);

    std::vector<EventKind> expected = {EventKind::ActionApplied, EventKind::Breakthrough,
                                       EventKind::Breakthrough};
    EXPECT_EQ(kinds(result.entries), expected);
    EXPECT_EQ(result.entries[1].payload->at("stage"), 1);
    EXPECT_EQ(result.entries[2].payload->at("stage"), 2);
    EXPECT_LT(result.entries[1].sequence, result.entries[2].sequence);

    EXPECT_EQ(result.status.stage, Stage::CoreFormation);
    EXPECT_EQ(result.status.phase, SessionPhase::Active);
    EXPECT_EQ(manager_.statistics().value().breakthroughs, 2u);
}

TEST_F(SessionManagerTest, ReachingTerminalStageAscends) {
    ASSERT_TRUE(manager_.createSession(boosted(200.0), talent(5)).hasValue());

    auto result = apply(manager_, Cultivate{});
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.entries.back().kind, EventKind::Ascended);
    auto breakthroughs = std::count_if(result.entries.begin(), result.entries.end(),
                                       [](const LogEntry& e) {
                                           return e.kind == EventKind::Breakthrough;
                                       });
    EXPECT_EQ(breakthroughs, 5);
    EXPECT_EQ(result.status.phase, SessionPhase::Ascended);
    EXPECT_EQ(result.status.stage, Stage::Ascension);
    EXPECT_FALSE(result.status.nextThreshold.has_value());
    EXPECT_DOUBLE_EQ(result.status.progressPercent, 100.0);

    auto after = apply(manager_, Meditate{});
    EXPECT_FALSE(after.accepted);
    EXPECT_EQ(after.error->code(), ErrorCode::InvalidPhase);
    EXPECT_TRUE(manager_.availableActions().empty());
}

// =============================================================================
// Scenario: death and restart
// =============================================================================

TEST_F(SessionManagerTest, HealthReachingZeroEndsTheGame) {
    RuleSet rules;
    rules.actionHealthCost[static_cast<std::size_t>(ActionKind::Wait)] = 100;
    SessionManager manager(rules);
    ASSERT_TRUE(manager.createSession(NormalDifficulty(), talent(5)).hasValue());
    auto firstId = manager.sessionId();

    auto fatal = apply(manager, Wait{});
    ASSERT_TRUE(fatal.accepted);
    EXPECT_EQ(fatal.entries.back().kind, EventKind::GameOver);
    EXPECT_EQ(fatal.status.phase, SessionPhase::GameOver);
    EXPECT_FALSE(fatal.status.alive);
    EXPECT_EQ(fatal.status.health, 0);
    EXPECT_EQ(fatal.status.powerRating, 0);

    auto frozen = apply(manager, Wait{});
    EXPECT_FALSE(frozen.accepted);
    ASSERT_TRUE(frozen.error.has_value());
    EXPECT_EQ(frozen.error->code(), ErrorCode::InvalidPhase);
    EXPECT_EQ(frozen.entries.size(), 1u);
    EXPECT_EQ(frozen.status.health, 0);
    EXPECT_EQ(frozen.status.totalActions, fatal.status.totalActions);

    auto fresh = manager.restart();
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_EQ(fresh.value().phase, SessionPhase::Active);
    EXPECT_EQ(fresh.value().health, fresh.value().maxHealth);
    EXPECT_EQ(fresh.value().totalActions, 0u);
    EXPECT_NE(manager.sessionId(), firstId);
    EXPECT_EQ(manager.logEntries().size(), 2u);
    EXPECT_EQ(manager.statistics().value().rejectedActions, 0u);
}

TEST_F(SessionManagerTest, DeathTakesPrecedenceOverAscension) {
    RuleSet rules;
    rules.actionHealthCost[static_cast<std::size_t>(ActionKind::Cultivate)] = 100;
    SessionManager manager(rules);
    ASSERT_TRUE(manager.createSession(boosted(200.0), talent(5)).hasValue());

    auto result = apply(manager, Cultivate{});
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.entries.back().kind, EventKind::GameOver);
    EXPECT_EQ(result.status.phase, SessionPhase::GameOver);
}

TEST_F(SessionManagerTest, RestartWithNewDifficulty) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    ASSERT_TRUE(apply(manager_, Cultivate{}).accepted);

    auto view = manager_.restart(preset("easy"), talent(9));
    ASSERT_TRUE(view.hasValue());
    EXPECT_EQ(view.value().difficultyName, "简单");
    EXPECT_EQ(view.value().pills, 3u);
    EXPECT_EQ(view.value().totalExperience, 0);
    EXPECT_EQ(view.value().sessionId.value(), 2u);
}

TEST_F(SessionManagerTest, FailedRestartKeepsCurrentSession) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    ASSERT_TRUE(apply(manager_, Cultivate{}).accepted);

    auto result = manager_.restart(preset("easy"), talent(1));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(manager_.snapshot().value().totalExperience, 19);
}

TEST_F(SessionManagerTest, RestartWithoutSession) {
    auto result = manager_.restart();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SessionNotStarted);
}

TEST_F(SessionManagerTest, EndSessionDiscardsState) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    manager_.endSession();
    EXPECT_FALSE(manager_.hasSession());
    EXPECT_TRUE(manager_.phase().hasError());
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(SessionManagerTest, AvailableActionsFollowPreconditions) {
    ASSERT_TRUE(manager_.createSession(preset("hard"), talent(3)).hasValue());
    std::vector<ActionKind> expected = {ActionKind::Meditate, ActionKind::Cultivate,
                                        ActionKind::Wait};
    EXPECT_EQ(manager_.availableActions(), expected);
}

TEST_F(SessionManagerTest, PreviewDoesNotMutateOrLog) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    auto logBefore = manager_.logEntries().size();

    auto preview = manager_.previewAction(Cultivate{});
    ASSERT_TRUE(preview.hasValue());
    EXPECT_EQ(preview.value().experienceDelta, 19);
    EXPECT_EQ(manager_.logEntries().size(), logBefore);
    EXPECT_EQ(manager_.snapshot().value().totalExperience, 0);

    auto applied = apply(manager_, Cultivate{});
    EXPECT_EQ(applied.outcome->experienceDelta, preview.value().experienceDelta);
}

TEST_F(SessionManagerTest, PreviewReportsRejection) {
    ASSERT_TRUE(manager_.createSession(preset("hard"), talent(3)).hasValue());
    auto preview = manager_.previewAction(ConsumePill{});
    ASSERT_TRUE(preview.hasError());
    EXPECT_EQ(preview.error().code(), ErrorCode::InsufficientResource);
    EXPECT_EQ(manager_.logEntries().size(), 2u);
}

TEST_F(SessionManagerTest, ApplyByKind) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    auto result = manager_.applyAction(ActionKind::Meditate);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().action, ActionKind::Meditate);
    EXPECT_EQ(result.value().status.meditationStreak, 1u);
}

TEST_F(SessionManagerTest, StatisticsTrackActions) {
    ASSERT_TRUE(manager_.createSession(preset("easy"), talent(5)).hasValue());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(apply(manager_, Meditate{}).accepted);
    }
    ASSERT_TRUE(apply(manager_, ConsumePill{}).accepted);
    ASSERT_TRUE(apply(manager_, Meditate{}).accepted);

    auto stats = manager_.statistics().value();
    EXPECT_EQ(stats.accepted(ActionKind::Meditate), 4u);
    EXPECT_EQ(stats.accepted(ActionKind::ConsumePill), 1u);
    EXPECT_EQ(stats.acceptedTotal(), 5u);
    EXPECT_EQ(stats.pillsConsumed, 1u);
    EXPECT_EQ(stats.longestMeditationStreak, 3u);
}

TEST_F(SessionManagerTest, SnapshotKeepsOnlyRecentEntries) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(apply(manager_, Wait{}).accepted);
    }

    auto view = manager_.snapshot().value();
    ASSERT_EQ(view.recentEntries.size(), 8u);
    EXPECT_EQ(view.recentEntries.back().sequence, 12u);
    EXPECT_EQ(view.recentEntries.front().sequence, 5u);
    EXPECT_EQ(manager_.logEntries().size(), 12u);
}

TEST_F(SessionManagerTest, EventSignalStreamsEveryEntry) {
    std::vector<uint64_t> seen;
    manager_.onEvent().connect([&](const LogEntry& entry) { seen.push_back(entry.sequence); });

    ASSERT_TRUE(manager_.createSession(boosted(20.0), talent(5)).hasValue());
    apply(manager_, Cultivate{});
    apply(manager_, ConsumePill{});
    apply(manager_, ConsumePill{});

    std::vector<uint64_t> expected = {1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(manager_.logEntries().size(), seen.size());
}

TEST_F(SessionManagerTest, HandlerMayEndSessionDuringAction) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());
    std::vector<EventKind> seen;
    manager_.onEvent().connect([&](const LogEntry& entry) {
        seen.push_back(entry.kind);
        if (entry.kind == EventKind::ActionApplied) {
            manager_.endSession();
        }
    });

    auto result = apply(manager_, Wait{});
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.status.totalActions, 1u);
    EXPECT_EQ(result.status.recentEntries.size(), 3u);
    EXPECT_FALSE(manager_.hasSession());
    EXPECT_EQ(seen, std::vector<EventKind>{EventKind::ActionApplied});

    auto after = manager_.applyAction(Wait{});
    ASSERT_TRUE(after.hasError());
    EXPECT_EQ(after.error().code(), ErrorCode::SessionNotStarted);
}

TEST_F(SessionManagerTest, HandlerMayRestartDuringAction) {
    ASSERT_TRUE(manager_.createSession(boosted(20.0), talent(5)).hasValue());
    auto firstId = manager_.sessionId();

    std::vector<EventKind> seen;
    bool restarted = false;
    manager_.onEvent().connect([&](const LogEntry& entry) {
        seen.push_back(entry.kind);
        if (entry.kind == EventKind::ActionApplied && !restarted) {
            restarted = true;
            ASSERT_TRUE(manager_.restart().hasValue());
        }
    });

    auto result = apply(manager_, Cultivate{});
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.status.stage, Stage::CoreFormation);

    // The old session's breakthroughs are delivered before the new session starts.
    std::vector<EventKind> expected = {EventKind::ActionApplied, EventKind::Breakthrough,
                                       EventKind::Breakthrough, EventKind::SessionStarted,
                                       EventKind::SessionStarted};
    EXPECT_EQ(seen, expected);

    EXPECT_NE(manager_.sessionId(), firstId);
    auto fresh = manager_.snapshot().value();
    EXPECT_EQ(fresh.phase, SessionPhase::Active);
    EXPECT_EQ(fresh.totalExperience, 0);
    EXPECT_EQ(fresh.totalActions, 0u);
    EXPECT_EQ(manager_.logEntries().size(), 2u);

    auto stats = manager_.statistics().value();
    EXPECT_EQ(stats.acceptedTotal(), 0u);
    EXPECT_EQ(stats.breakthroughs, 0u);
}

TEST_F(SessionManagerTest, NestedActionFromHandlerKeepsStreamOrdered) {
    ASSERT_TRUE(manager_.createSession(NormalDifficulty(), talent(5)).hasValue());

    std::vector<uint64_t> sequences;
    int nested = 0;
    manager_.onEvent().connect([&](const LogEntry& entry) {
        sequences.push_back(entry.sequence);
        if (entry.kind == EventKind::ActionApplied && nested++ == 0) {
            auto inner = manager_.applyAction(Wait{});
            EXPECT_TRUE(inner.hasValue());
        }
    });

    apply(manager_, Meditate{});
    EXPECT_EQ(sequences, (std::vector<uint64_t>{3, 4}));
    EXPECT_EQ(manager_.snapshot().value().totalActions, 2u);
}
