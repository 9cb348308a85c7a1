#pragma once

/// @file action_system.hpp
/// @brief ActionSystem: two-phase (validate, apply) resolution of player actions.
///
/// Validation checks the session phase and the action's resource
/// preconditions without touching anything. Application computes deltas
/// through the RuleEngine and mutates the character only through the
/// components' clamped mutators. Callers apply to a working copy and commit
/// on success, so a failed action never leaves partial effects behind.

#include <cstdint>
#include <string>
#include <vector>

#include "cge/foundation/game_result.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/character.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/progression_types.hpp"
#include "cge/game/rule_engine.hpp"

namespace cge::game {

/// Effects actually applied by one action (post-clamping values).
struct ActionOutcome {
    ActionKind kind = ActionKind::Wait;
    int32_t healthDelta = 0;       ///< Net health change, upkeep included.
    int32_t healthCost = 0;        ///< Upkeep actually deducted (>= 0).
    int32_t manaDelta = 0;         ///< Net mana change.
    int64_t experienceDelta = 0;
    uint32_t pillsConsumed = 0;
    uint32_t pillsRemaining = 0;
    std::vector<Stage> breakthroughs;  ///< Tiers entered, ascending.
    bool died = false;                 ///< Health reached zero.
    bool reachedTerminalStage = false;
};

/// Resolves the closed action set against one character.
///
/// Usage:
/// @code
///   ActionSystem actions(rules, difficulty);
///   if (auto ok = actions.Validate(action, phase, character); ok) {
///       Character working = character;
///       auto outcome = actions.Apply(action, working);
///       if (outcome) { character = std::move(working); }
///   }
/// @endcode
class ActionSystem {
public:
    ActionSystem(const RuleEngine& rules, const DifficultySettings& difficulty) noexcept
        : rules_(rules), difficulty_(difficulty) {}

    /// Check that @p action may run now.
    ///
    /// @return InvalidPhase outside SessionPhase::Active, InsufficientResource
    ///         when a consumption precondition is unmet. Full resources never
    ///         block an action.
    [[nodiscard]] foundation::GameResult<void> Validate(const Action& action,
                                                        SessionPhase phase,
                                                        const Character& character) const;

    /// Apply @p action to @p character and report what changed.
    ///
    /// Re-checks resource preconditions; on error @p character may have been
    /// partially modified and must be discarded by the caller.
    [[nodiscard]] foundation::GameResult<ActionOutcome> Apply(const Action& action,
                                                              Character& character) const;

    /// One-line human-readable summary of an outcome.
    [[nodiscard]] static std::string Describe(const ActionOutcome& outcome);

private:
    [[nodiscard]] foundation::GameResult<void> checkResources(const Action& action,
                                                              const Character& character) const;

    const RuleEngine& rules_;
    const DifficultySettings& difficulty_;
};

}  // namespace cge::game
