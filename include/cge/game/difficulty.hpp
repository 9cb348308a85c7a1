#pragma once

/// @file difficulty.hpp
/// @brief DifficultySettings: immutable per-session configuration.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cge/foundation/config_manager.hpp"
#include "cge/foundation/game_result.hpp"

namespace cge::game {

/// Upper bound for both difficulty multipliers.
constexpr double kMaxDifficultyMultiplier = 1000.0;

/// Inclusive talent range a new character's talent is drawn from.
struct TalentRange {
    int32_t min = 1;
    int32_t max = 10;

    [[nodiscard]] bool Contains(int32_t talent) const noexcept {
        return talent >= min && talent <= max;
    }
};

/// Chosen once before a session starts; never mutated afterwards.
struct DifficultySettings {
    std::string id;                    ///< "easy", "normal", "hard", or a custom id.
    std::string name;                  ///< Display name, e.g. "普通".
    TalentRange talentRange;
    uint32_t initialPillCount = 0;
    double experienceMultiplier = 1.0;
    double recoveryMultiplier = 1.0;   ///< Scales meditation and pill restoration.

    /// Reject settings that cannot produce a valid session:
    /// an empty or out-of-bounds talent range, or a multiplier outside
    /// (0, kMaxDifficultyMultiplier].
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Built-in presets: easy (简单), normal (普通), hard (困难).
[[nodiscard]] const std::vector<DifficultySettings>& DifficultyPresets();

/// Look up a preset by id or display name.
[[nodiscard]] std::optional<DifficultySettings> FindDifficulty(std::string_view idOrName);

/// The "normal" preset.
[[nodiscard]] DifficultySettings NormalDifficulty();

/// Read `difficulties.<id>.*` from configuration.
///
/// Keys: name, talent_min, talent_max, initial_pills, experience_multiplier,
/// recovery_multiplier (optional, default 1.0). When @p id names a built-in
/// preset, missing keys inherit the preset's values.
[[nodiscard]] foundation::GameResult<DifficultySettings> LoadDifficulty(
    const foundation::ConfigManager& config, std::string_view id);

}  // namespace cge::game
