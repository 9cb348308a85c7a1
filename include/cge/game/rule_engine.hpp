#pragma once

/// @file rule_engine.hpp
/// @brief RuleEngine: pure numeric rules for restoration, gain, cost, and stages.
///
/// Every computation is a deterministic function of its explicit inputs
/// (tuning table, talent, difficulty, streak). The engine holds no mutable
/// state and never touches a character.

#include <array>
#include <cstdint>
#include <string>
#include <utility>

#include "cge/foundation/config_manager.hpp"
#include "cge/foundation/game_result.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/progression_types.hpp"

namespace cge::game {

struct CharacterStatus;

/// Ceiling on the experience a single cultivation can grant.
constexpr int64_t kMaxCultivationGain = 1'000'000'000'000;

/// Tuning constants. Defaults are the shipped balance; any of them can be
/// overridden from the `rules.*` section of the configuration.
struct RuleSet {
    int32_t maxHealth = 100;
    int32_t maxMana = 100;
    double startingManaRatio = 0.5;

    int32_t meditationBaseHealth = 2;
    int32_t meditationBaseMana = 8;
    int32_t meditationHealthPerTalent = 1;
    int32_t meditationManaPerTalent = 1;

    int32_t pillHealth = 20;
    int32_t pillMana = 20;

    int32_t cultivationBaseExperience = 12;
    double cultivationExperiencePerTalent = 1.5;
    int32_t cultivationManaCost = 20;
    double cultivationStreakBonus = 0.10;   ///< Per prior meditation.
    uint32_t cultivationStreakCap = 5;      ///< Streak beyond this adds nothing.

    /// Vitality upkeep per action, indexed by ActionKind. All zero by default,
    /// so the shipped action set never reduces health.
    std::array<int32_t, kActionKindCount> actionHealthCost{};

    uint32_t recentLogEntries = 8;

    /// Check the monotonicity and boundedness requirements.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Restoration or cost expressed per resource.
struct ResourceDelta {
    int32_t health = 0;
    int32_t mana = 0;
};

/// Advice for the player derived from the current status.
struct Recommendation {
    ActionKind action = ActionKind::Meditate;
    std::string advice;
};

/// Stateless rule computations.
///
/// Usage:
/// @code
///   RuleEngine rules;
///   auto gain = rules.CultivationGain(5, NormalDifficulty(), 0);  // 19
///   auto entry = RuleEngine::StageThreshold(1);                  // 100
/// @endcode
class RuleEngine {
public:
    RuleEngine() = default;
    explicit RuleEngine(RuleSet rules) : rules_(std::move(rules)) {}

    [[nodiscard]] const RuleSet& Rules() const noexcept { return rules_; }

    /// Health and mana restored by meditation.
    /// Strictly increasing in talent and never negative.
    [[nodiscard]] ResourceDelta MeditationEffect(int32_t talent,
                                                 const DifficultySettings& difficulty) const;

    /// Experience granted by one cultivation.
    ///
    /// @param streak Consecutive meditations before this cultivation; the
    ///               bonus stops growing at RuleSet::cultivationStreakCap.
    /// @return A value in [0, kMaxCultivationGain].
    [[nodiscard]] int64_t CultivationGain(int32_t talent,
                                          const DifficultySettings& difficulty,
                                          uint32_t streak) const;

    /// Fixed restoration from one pill, independent of talent.
    [[nodiscard]] ResourceDelta PillEffect(const DifficultySettings& difficulty) const;

    /// Mana spent by one cultivation.
    [[nodiscard]] int32_t CultivationCost() const noexcept { return rules_.cultivationManaCost; }

    /// Health upkeep of an action (0 unless configured).
    [[nodiscard]] int32_t ActionHealthCost(ActionKind kind) const noexcept;

    /// Experience required to enter stage @p ordinal.
    /// @return OutOfRange for an ordinal beyond the terminal tier.
    [[nodiscard]] static foundation::GameResult<int64_t> StageThreshold(uint32_t ordinal);

    /// Threshold of the tier after @p stage.
    /// @return OutOfRange for the terminal tier, which has no successor.
    [[nodiscard]] static foundation::GameResult<int64_t> NextStageThreshold(Stage stage);

    /// Highest tier whose threshold <= @p totalExperience.
    [[nodiscard]] static const StageLevel& ResolveStage(int64_t totalExperience) noexcept {
        return ResolveStageLevel(totalExperience);
    }

    /// Percentage [0, 100] of the way from the current tier to the next;
    /// 100 at the terminal tier.
    [[nodiscard]] static double StageProgress(int64_t totalExperience) noexcept;

    /// Overall strength score; 0 for a dead character.
    [[nodiscard]] int64_t PowerRating(const CharacterStatus& status) const;

    /// Suggested next action for the current status.
    [[nodiscard]] Recommendation RecommendAction(const CharacterStatus& status) const;

private:
    RuleSet rules_;
};

/// Build a RuleSet from `rules.*` keys, starting from the defaults.
///
/// Recognised keys: max_health, max_mana, starting_mana_ratio,
/// meditation.{base_health,base_mana,health_per_talent,mana_per_talent},
/// pill.{health,mana}, cultivation.{base_experience,experience_per_talent,
/// mana_cost,streak_bonus,streak_cap}, health_cost.{meditate,consume_pill,
/// cultivate,wait}, recent_log_entries.
[[nodiscard]] foundation::GameResult<RuleSet> LoadRuleSet(const foundation::ConfigManager& config);

}  // namespace cge::game
