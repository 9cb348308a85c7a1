/// @file action_system.cpp
/// @brief ActionSystem implementation.
///
/// Apply order for every action:
///   1. Deduct the configured health upkeep
///   2. Action-specific effects (restoration, consumption, experience)
///   3. Update the meditation streak and action counter
///   4. Derive death and terminal-stage flags

#include "cge/game/action_system.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

#include "cge/foundation/game_logger.hpp"

namespace cge::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Per-action effect step. Each overload mutates @p character through the
/// component mutators and records the applied values in @p outcome.
struct EffectVisitor {
    const RuleEngine& rules;
    const DifficultySettings& difficulty;
    Character& character;
    ActionOutcome& outcome;

    GameResult<void> operator()(const Meditate&) const {
        auto effect = rules.MeditationEffect(character.Talent().Value(), difficulty);
        outcome.healthDelta += character.Health().ApplyDelta(effect.health);
        outcome.manaDelta += character.Mana().ApplyDelta(effect.mana);
        return GameResult<void>::ok();
    }

    GameResult<void> operator()(const ConsumePill&) const {
        auto remaining = character.Inventory().Consume(1);
        if (!remaining) {
            return GameResult<void>::err(std::move(remaining).error());
        }
        outcome.pillsConsumed = 1;
        outcome.pillsRemaining = remaining.value();

        auto effect = rules.PillEffect(difficulty);
        outcome.healthDelta += character.Health().ApplyDelta(effect.health);
        outcome.manaDelta += character.Mana().ApplyDelta(effect.mana);
        return GameResult<void>::ok();
    }

    GameResult<void> operator()(const Cultivate&) const {
        // The streak bonus uses the streak built up before this action.
        auto gain = rules.CultivationGain(character.Talent().Value(), difficulty,
                                          character.MeditationStreak());
        outcome.manaDelta += character.Mana().ApplyDelta(-rules.CultivationCost());

        auto crossed = character.Experience().Add(gain);
        if (!crossed) {
            return GameResult<void>::err(std::move(crossed).error());
        }
        outcome.experienceDelta = gain;
        outcome.breakthroughs = std::move(crossed).value();
        return GameResult<void>::ok();
    }

    GameResult<void> operator()(const Wait&) const {
        return GameResult<void>::ok();
    }
};

}  // namespace

GameResult<void> ActionSystem::Validate(const Action& action, SessionPhase phase,
                                        const Character& character) const {
    if (phase != SessionPhase::Active) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidPhase,
            "session is " + std::string(sessionPhaseName(phase)) + "; only restart is accepted"));
    }
    return checkResources(action, character);
}

GameResult<void> ActionSystem::checkResources(const Action& action,
                                              const Character& character) const {
    return std::visit(
        [&](const auto& a) -> GameResult<void> {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, ConsumePill>) {
                if (!character.Inventory().HasPills()) {
                    return GameResult<void>::err(GameError(
                        ErrorCode::InsufficientResource, "no pills left to consume"));
                }
            } else if constexpr (std::is_same_v<T, Cultivate>) {
                if (character.Mana().Current() < rules_.CultivationCost()) {
                    return GameResult<void>::err(GameError(
                        ErrorCode::InsufficientResource,
                        "cultivation needs " + std::to_string(rules_.CultivationCost())
                            + " mana, have " + std::to_string(character.Mana().Current())));
                }
            }
            return GameResult<void>::ok();
        },
        action);
}

GameResult<ActionOutcome> ActionSystem::Apply(const Action& action, Character& character) const {
    auto ready = checkResources(action, character);
    if (!ready) {
        return GameResult<ActionOutcome>::err(std::move(ready).error());
    }

    ActionOutcome outcome;
    outcome.kind = KindOf(action);
    outcome.pillsRemaining = character.Inventory().PillCount();

    auto upkeep = character.Health().ApplyDelta(-rules_.ActionHealthCost(outcome.kind));
    outcome.healthCost = -upkeep;
    outcome.healthDelta = upkeep;

    auto applied = std::visit(EffectVisitor{rules_, difficulty_, character, outcome}, action);
    if (!applied) {
        return GameResult<ActionOutcome>::err(std::move(applied).error());
    }

    character.RecordAction(outcome.kind);
    outcome.died = !character.IsAlive();
    outcome.reachedTerminalStage = IsTerminalStage(character.CurrentStage());

    CGE_LOG_DEBUG(LogCategory::Action,
                  std::string(actionName(outcome.kind)) + ": " + Describe(outcome));
    return GameResult<ActionOutcome>::ok(std::move(outcome));
}

std::string ActionSystem::Describe(const ActionOutcome& outcome) {
    std::ostringstream oss;
    switch (outcome.kind) {
        case ActionKind::Meditate:
            if (outcome.healthDelta + outcome.healthCost == 0 && outcome.manaDelta == 0) {
                oss << "Meditated; already at full health and mana, nothing restored.";
            } else {
                oss << "Meditated, restoring " << outcome.healthDelta + outcome.healthCost
                    << " health and " << outcome.manaDelta << " mana.";
            }
            break;
        case ActionKind::ConsumePill:
            oss << "Consumed a pill (" << outcome.pillsRemaining << " left), restoring "
                << outcome.healthDelta + outcome.healthCost << " health and "
                << outcome.manaDelta << " mana.";
            break;
        case ActionKind::Cultivate:
            oss << "Cultivated, spending " << -outcome.manaDelta << " mana for "
                << outcome.experienceDelta << " experience.";
            break;
        case ActionKind::Wait:
        case ActionKind::COUNT:
            oss << "Waited; time passes.";
            break;
    }
    if (outcome.healthCost > 0) {
        oss << " Upkeep cost " << outcome.healthCost << " health.";
    }
    return oss.str();
}

}  // namespace cge::game
