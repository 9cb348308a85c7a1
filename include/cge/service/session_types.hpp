#pragma once

/// @file session_types.hpp
/// @brief Value types exchanged between the session manager and its callers.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cge/foundation/game_error.hpp"
#include "cge/foundation/types.hpp"
#include "cge/game/action_system.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/character.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/event_log.hpp"
#include "cge/game/progression_types.hpp"
#include "cge/game/rule_engine.hpp"

namespace cge::service {

// -- Options ------------------------------------------------------------------

/// Per-session character setup.
struct SessionOptions {
    std::string characterName = "无名修士";

    /// Fixed talent; must lie inside the difficulty's talent range.
    /// Sampled uniformly from the range when absent.
    std::optional<int32_t> talent;

    /// Seed for talent sampling; std::random_device when absent.
    std::optional<uint64_t> seed;
};

// -- Statistics ---------------------------------------------------------------

/// Per-session counters, reset together with the session.
struct SessionStatistics {
    std::array<uint64_t, game::kActionKindCount> acceptedActions{};
    uint64_t rejectedActions = 0;
    uint64_t pillsConsumed = 0;
    uint64_t breakthroughs = 0;
    uint32_t longestMeditationStreak = 0;

    [[nodiscard]] uint64_t accepted(game::ActionKind kind) const noexcept {
        return acceptedActions[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] uint64_t acceptedTotal() const noexcept {
        uint64_t total = 0;
        for (auto count : acceptedActions) {
            total += count;
        }
        return total;
    }
};

// -- Session state ------------------------------------------------------------

/// Everything one session owns. Replaced as a whole on restart.
struct SessionState {
    foundation::SessionId id;
    game::DifficultySettings difficulty;
    SessionOptions options;
    game::SessionPhase phase = game::SessionPhase::Active;
    game::Character character;
    game::EventLog log;
    SessionStatistics statistics;
};

// -- Snapshot -----------------------------------------------------------------

/// Read-only projection handed to renderers. Holds copies only.
struct StatusView {
    foundation::SessionId sessionId;
    std::string difficultyName;
    game::SessionPhase phase = game::SessionPhase::Active;

    std::string characterName;
    int32_t talent = 0;
    int32_t health = 0;
    int32_t maxHealth = 0;
    int32_t mana = 0;
    int32_t maxMana = 0;

    int64_t totalExperience = 0;
    game::Stage stage = game::Stage::QiRefining;
    std::string stageDisplayName;
    std::optional<int64_t> nextThreshold;   ///< Absent at the terminal tier.
    double progressPercent = 0.0;

    uint32_t pills = 0;
    uint32_t meditationStreak = 0;
    uint64_t totalActions = 0;
    bool alive = false;

    int64_t powerRating = 0;
    game::Recommendation recommendation;

    std::vector<game::LogEntry> recentEntries;   ///< Oldest first.
};

// -- Action result ------------------------------------------------------------

/// Result of one applyAction() call.
///
/// A rejected action is still a successful call: `accepted` is false, `error`
/// carries the reason and `entries` holds the single rejection entry.
struct ActionResult {
    game::ActionKind action = game::ActionKind::Wait;
    bool accepted = false;
    std::optional<foundation::GameError> error;
    std::optional<game::ActionOutcome> outcome;
    std::string summary;
    std::vector<game::LogEntry> entries;   ///< Entries appended by this call.
    StatusView status;
};

}  // namespace cge::service
