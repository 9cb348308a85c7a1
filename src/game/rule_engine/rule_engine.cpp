/// @file rule_engine.cpp
/// @brief RuleEngine formulas and RuleSet loading.
///
/// Formulas:
///   meditation  hp = round(baseHp * recovery) + talent * hpPerTalent
///               mp = round(baseMp * recovery) + talent * mpPerTalent
///   pill        hp = round(pillHp * recovery), mp = round(pillMp * recovery)
///   cultivation exp = floor((base + talent * perTalent) * expMultiplier
///                           * (1 + bonus * min(streak, cap)))

#include "cge/game/rule_engine.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include "cge/foundation/game_logger.hpp"
#include "cge/game/character.hpp"

namespace cge::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::array<double, kStageCount> kStagePowerMultipliers = {
    1.0, 1.5, 2.5, 4.0, 6.0, 10.0
};

int32_t scaleRecovery(int32_t base, double multiplier) {
    return static_cast<int32_t>(std::lround(base * multiplier));
}

GameResult<void> invalidRule(const std::string& what) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, "invalid rule: " + what));
}

}  // namespace

// -- RuleSet ------------------------------------------------------------------

GameResult<void> RuleSet::Validate() const {
    if (maxHealth <= 0 || maxMana <= 0) {
        return invalidRule("max health and max mana must be positive");
    }
    if (!(startingManaRatio >= 0.0 && startingManaRatio <= 1.0)) {
        return invalidRule("starting mana ratio must be within [0, 1]");
    }
    if (meditationBaseHealth < 0 || meditationBaseMana < 0) {
        return invalidRule("meditation base restoration must be non-negative");
    }
    // A step of at least 1 per talent point keeps restoration strictly
    // increasing in talent after integer rounding.
    if (meditationHealthPerTalent < 1 || meditationManaPerTalent < 1) {
        return invalidRule("meditation restoration per talent must be at least 1");
    }
    if (pillHealth < 0 || pillMana < 0) {
        return invalidRule("pill restoration must be non-negative");
    }
    if (cultivationBaseExperience < 0 || !(cultivationExperiencePerTalent >= 0.0)) {
        return invalidRule("cultivation experience must be non-negative");
    }
    if (cultivationManaCost < 0) {
        return invalidRule("cultivation mana cost must be non-negative");
    }
    if (!(cultivationStreakBonus >= 0.0) || !std::isfinite(cultivationStreakBonus)) {
        return invalidRule("cultivation streak bonus must be non-negative");
    }
    if (std::any_of(actionHealthCost.begin(), actionHealthCost.end(),
                    [](int32_t cost) { return cost < 0; })) {
        return invalidRule("action health costs must be non-negative");
    }
    return GameResult<void>::ok();
}

// -- Restoration and gain -----------------------------------------------------

ResourceDelta RuleEngine::MeditationEffect(int32_t talent,
                                           const DifficultySettings& difficulty) const {
    auto aptitude = std::max(talent, 0);
    ResourceDelta delta;
    delta.health = scaleRecovery(rules_.meditationBaseHealth, difficulty.recoveryMultiplier)
                 + aptitude * rules_.meditationHealthPerTalent;
    delta.mana = scaleRecovery(rules_.meditationBaseMana, difficulty.recoveryMultiplier)
               + aptitude * rules_.meditationManaPerTalent;
    return delta;
}

int64_t RuleEngine::CultivationGain(int32_t talent,
                                    const DifficultySettings& difficulty,
                                    uint32_t streak) const {
    auto effectiveStreak = std::min(streak, rules_.cultivationStreakCap);
    double base = rules_.cultivationBaseExperience
                + std::max(talent, 0) * rules_.cultivationExperiencePerTalent;
    double focus = 1.0 + rules_.cultivationStreakBonus * effectiveStreak;
    double gain = std::floor(base * difficulty.experienceMultiplier * focus);
    if (!(gain > 0.0)) {
        return 0;
    }
    if (gain >= static_cast<double>(kMaxCultivationGain)) {
        return kMaxCultivationGain;
    }
    return static_cast<int64_t>(gain);
}

ResourceDelta RuleEngine::PillEffect(const DifficultySettings& difficulty) const {
    return {scaleRecovery(rules_.pillHealth, difficulty.recoveryMultiplier),
            scaleRecovery(rules_.pillMana, difficulty.recoveryMultiplier)};
}

int32_t RuleEngine::ActionHealthCost(ActionKind kind) const noexcept {
    auto idx = static_cast<std::size_t>(kind);
    return idx < kActionKindCount ? rules_.actionHealthCost[idx] : 0;
}

// -- Stage table --------------------------------------------------------------

GameResult<int64_t> RuleEngine::StageThreshold(uint32_t ordinal) {
    if (ordinal >= kStageCount) {
        return GameResult<int64_t>::err(GameError(
            ErrorCode::OutOfRange,
            "stage ordinal " + std::to_string(ordinal) + " is beyond the terminal tier"));
    }
    return GameResult<int64_t>::ok(kStageTable[ordinal].threshold);
}

GameResult<int64_t> RuleEngine::NextStageThreshold(Stage stage) {
    if (IsTerminalStage(stage)) {
        return GameResult<int64_t>::err(GameError(
            ErrorCode::OutOfRange,
            std::string(stageName(stage)) + " is the terminal tier"));
    }
    return StageThreshold(GetStageLevel(stage).rank + 1);
}

double RuleEngine::StageProgress(int64_t totalExperience) noexcept {
    const auto& current = ResolveStageLevel(totalExperience);
    if (current.terminal) {
        return 100.0;
    }
    const auto& next = kStageTable[current.rank + 1];
    auto span = static_cast<double>(next.threshold - current.threshold);
    auto done = static_cast<double>(totalExperience - current.threshold);
    return std::clamp(done / span * 100.0, 0.0, 100.0);
}

// -- Assessment ---------------------------------------------------------------

int64_t RuleEngine::PowerRating(const CharacterStatus& status) const {
    if (!status.alive) {
        return 0;
    }
    double score = status.health * 0.3
                 + status.mana * 0.3
                 + static_cast<double>(status.totalExperience) * 0.2
                 + status.talent * 10.0
                 + status.pills * 5.0;
    return static_cast<int64_t>(score * kStagePowerMultipliers[static_cast<std::size_t>(status.stage)]);
}

Recommendation RuleEngine::RecommendAction(const CharacterStatus& status) const {
    if (!status.alive) {
        return {ActionKind::Wait, "Cultivation has failed; restart to begin anew."};
    }

    auto ratio = [](int32_t current, int32_t max) {
        return max > 0 ? static_cast<double>(current) / max : 0.0;
    };
    double hp = ratio(status.health, status.maxHealth);
    double mp = ratio(status.mana, status.maxMana);
    bool hasPills = status.pills > 0;

    if (hp < 0.3) {
        return hasPills
            ? Recommendation{ActionKind::ConsumePill, "Vitality is failing; take a pill now."}
            : Recommendation{ActionKind::Meditate, "Vitality is failing and no pills remain; meditate to recover."};
    }
    if (mp < 0.3 || status.mana < CultivationCost()) {
        return hasPills
            ? Recommendation{ActionKind::ConsumePill, "Mana is low; a pill will restore it."}
            : Recommendation{ActionKind::Meditate, "Mana is low; meditate to restore it."};
    }
    if (mp > 0.8 && status.pills > 2) {
        return {ActionKind::Cultivate, "In excellent condition; cultivate at full effort."};
    }
    return {ActionKind::Cultivate, "Condition is steady; cultivate, or recover as needed."};
}

// -- Configuration ------------------------------------------------------------

namespace {

template <typename T>
bool readRule(const ConfigManager& config, const std::string& key, T& out,
              std::optional<GameError>& error) {
    auto value = config.getOr<T>("rules." + key, out);
    if (!value) {
        error = value.error();
        return false;
    }
    out = value.value();
    return true;
}

}  // namespace

GameResult<RuleSet> LoadRuleSet(const ConfigManager& config) {
    RuleSet rules;
    std::optional<GameError> error;

    auto& costs = rules.actionHealthCost;
    bool ok = readRule(config, "max_health", rules.maxHealth, error)
           && readRule(config, "max_mana", rules.maxMana, error)
           && readRule(config, "starting_mana_ratio", rules.startingManaRatio, error)
           && readRule(config, "meditation.base_health", rules.meditationBaseHealth, error)
           && readRule(config, "meditation.base_mana", rules.meditationBaseMana, error)
           && readRule(config, "meditation.health_per_talent", rules.meditationHealthPerTalent, error)
           && readRule(config, "meditation.mana_per_talent", rules.meditationManaPerTalent, error)
           && readRule(config, "pill.health", rules.pillHealth, error)
           && readRule(config, "pill.mana", rules.pillMana, error)
           && readRule(config, "cultivation.base_experience", rules.cultivationBaseExperience, error)
           && readRule(config, "cultivation.experience_per_talent",
                       rules.cultivationExperiencePerTalent, error)
           && readRule(config, "cultivation.mana_cost", rules.cultivationManaCost, error)
           && readRule(config, "cultivation.streak_bonus", rules.cultivationStreakBonus, error)
           && readRule(config, "cultivation.streak_cap", rules.cultivationStreakCap, error)
           && readRule(config, "recent_log_entries", rules.recentLogEntries, error);

    for (std::size_t i = 0; ok && i < kActionKindCount; ++i) {
        auto id = std::string(actionName(static_cast<ActionKind>(i)));
        ok = readRule(config, "health_cost." + id, costs[i], error);
    }

    if (!ok) {
        return GameResult<RuleSet>::err(std::move(*error));
    }

    auto valid = rules.Validate();
    if (!valid) {
        return GameResult<RuleSet>::err(
            GameError(ErrorCode::ConfigInvalidValue, std::string(valid.error().message())));
    }

    CGE_LOG_INFO(LogCategory::Config, "rule set loaded");
    return GameResult<RuleSet>::ok(std::move(rules));
}

}  // namespace cge::game
