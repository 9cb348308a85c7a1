/// @file character.cpp
/// @brief Character creation and status projection.

#include "cge/game/character.hpp"

#include <cmath>
#include <utility>

namespace cge::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

Character::Character(std::string name, TalentComponent talent, HealthComponent health,
                     ManaComponent mana, InventoryComponent inventory)
    : name_(std::move(name)),
      talent_(talent),
      health_(health),
      mana_(mana),
      inventory_(inventory) {}

GameResult<Character> Character::Create(std::string name, int32_t talent,
                                        const DifficultySettings& difficulty,
                                        const RuleSet& rules) {
    auto valid = difficulty.Validate();
    if (!valid) {
        return GameResult<Character>::err(std::move(valid).error());
    }
    if (auto tuned = rules.Validate(); !tuned) {
        return GameResult<Character>::err(std::move(tuned).error());
    }
    if (!difficulty.talentRange.Contains(talent)) {
        return GameResult<Character>::err(GameError(
            ErrorCode::InvalidArgument,
            "talent " + std::to_string(talent) + " is outside the '" + difficulty.id
                + "' range [" + std::to_string(difficulty.talentRange.min) + ", "
                + std::to_string(difficulty.talentRange.max) + "]"));
    }
    auto aptitude = TalentComponent::Create(talent);
    if (!aptitude) {
        return GameResult<Character>::err(std::move(aptitude).error());
    }

    auto startingMana = static_cast<int32_t>(
        std::lround(rules.maxMana * rules.startingManaRatio));

    return GameResult<Character>::ok(Character(
        std::move(name), aptitude.value(), HealthComponent(rules.maxHealth),
        ManaComponent(startingMana, rules.maxMana),
        InventoryComponent(difficulty.initialPillCount)));
}

void Character::RecordAction(ActionKind kind) noexcept {
    if (kind == ActionKind::Meditate) {
        ++meditationStreak_;
    } else {
        meditationStreak_ = 0;
    }
    ++totalActions_;
}

CharacterStatus Character::Status() const {
    CharacterStatus status;
    status.name = name_;
    status.health = health_.Current();
    status.maxHealth = health_.Max();
    status.mana = mana_.Current();
    status.maxMana = mana_.Max();
    status.totalExperience = experience_.Total();
    status.stage = CurrentStage();
    status.talent = talent_.Value();
    status.pills = inventory_.PillCount();
    status.meditationStreak = meditationStreak_;
    status.totalActions = totalActions_;
    status.alive = IsAlive();
    return status;
}

}  // namespace cge::game
