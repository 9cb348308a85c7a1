#pragma once

/// @file character.hpp
/// @brief Character: the aggregate of all character components.

#include <cstdint>
#include <string>

#include "cge/foundation/game_result.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/character_components.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/rule_engine.hpp"

namespace cge::game {

/// Read-only projection of every character field.
struct CharacterStatus {
    std::string name;
    int32_t health = 0;
    int32_t maxHealth = 0;
    int32_t mana = 0;
    int32_t maxMana = 0;
    int64_t totalExperience = 0;
    Stage stage = Stage::QiRefining;
    int32_t talent = 0;
    uint32_t pills = 0;
    uint32_t meditationStreak = 0;
    uint64_t totalActions = 0;
    bool alive = false;
};

/// One playable character.
///
/// Owns its components exclusively. `alive` and the stage are always derived
/// from health and experience. A Character is a value: the session applies
/// an action to a copy and commits it only when the whole action succeeded.
class Character {
public:
    /// Create a character at full health with the difficulty's starting pills.
    ///
    /// @return InvalidArgument if the difficulty or @p rules are invalid, or
    ///         @p talent lies outside the difficulty's talent range.
    [[nodiscard]] static foundation::GameResult<Character> Create(
        std::string name, int32_t talent,
        const DifficultySettings& difficulty, const RuleSet& rules);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    [[nodiscard]] HealthComponent& Health() noexcept { return health_; }
    [[nodiscard]] const HealthComponent& Health() const noexcept { return health_; }

    [[nodiscard]] ManaComponent& Mana() noexcept { return mana_; }
    [[nodiscard]] const ManaComponent& Mana() const noexcept { return mana_; }

    [[nodiscard]] ExperienceComponent& Experience() noexcept { return experience_; }
    [[nodiscard]] const ExperienceComponent& Experience() const noexcept { return experience_; }

    [[nodiscard]] const TalentComponent& Talent() const noexcept { return talent_; }

    [[nodiscard]] InventoryComponent& Inventory() noexcept { return inventory_; }
    [[nodiscard]] const InventoryComponent& Inventory() const noexcept { return inventory_; }

    [[nodiscard]] uint32_t MeditationStreak() const noexcept { return meditationStreak_; }
    [[nodiscard]] uint64_t TotalActions() const noexcept { return totalActions_; }

    /// Count a completed action and update the meditation streak:
    /// Meditate extends it, anything else resets it to zero.
    void RecordAction(ActionKind kind) noexcept;

    [[nodiscard]] bool IsAlive() const noexcept { return !health_.IsEmpty(); }
    [[nodiscard]] Stage CurrentStage() const noexcept { return experience_.CurrentStage(); }

    [[nodiscard]] CharacterStatus Status() const;

private:
    Character(std::string name, TalentComponent talent, HealthComponent health,
              ManaComponent mana, InventoryComponent inventory);

    std::string name_;
    TalentComponent talent_;
    HealthComponent health_;
    ManaComponent mana_;
    ExperienceComponent experience_;
    InventoryComponent inventory_;
    uint32_t meditationStreak_ = 0;
    uint64_t totalActions_ = 0;
};

}  // namespace cge::game
