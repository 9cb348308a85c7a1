#pragma once

/// @file character_components.hpp
/// @brief Character data components: Health, Mana, Experience, Talent, Inventory.
///
/// Each component owns its own bounds invariant and only exposes
/// bounds-respecting mutators. Components are plain values composed by
/// Character; none of them knows about actions or sessions.

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "cge/foundation/game_result.hpp"
#include "cge/game/progression_types.hpp"

namespace cge::game {

// -- ResourcePool -------------------------------------------------------------

/// A spendable, bounded resource: 0 <= current <= max.
///
/// @tparam Tag distinguishes Health from Mana at compile time.
template <typename Tag>
class ResourcePool {
public:
    /// Start full.
    explicit ResourcePool(int32_t max) noexcept
        : max_(std::max<int32_t>(max, 0)), current_(max_) {}

    /// Start at @p current, clamped into [0, max].
    ResourcePool(int32_t current, int32_t max) noexcept
        : max_(std::max<int32_t>(max, 0)),
          current_(std::clamp<int32_t>(current, 0, max_)) {}

    [[nodiscard]] int32_t Current() const noexcept { return current_; }
    [[nodiscard]] int32_t Max() const noexcept { return max_; }
    [[nodiscard]] bool IsFull() const noexcept { return current_ == max_; }
    [[nodiscard]] bool IsEmpty() const noexcept { return current_ == 0; }

    /// Fraction of max in [0, 1]; 0 for a zero-capacity pool.
    [[nodiscard]] double Ratio() const noexcept {
        return max_ == 0 ? 0.0 : static_cast<double>(current_) / max_;
    }

    /// Add @p amount (negative to spend), clamping into [0, max].
    ///
    /// @return The delta actually applied, which is smaller in magnitude than
    ///         @p amount when a bound was hit. Log this value, not the request.
    int32_t ApplyDelta(int32_t amount) noexcept {
        auto target = static_cast<int64_t>(current_) + amount;
        auto clamped = static_cast<int32_t>(std::clamp<int64_t>(target, 0, max_));
        auto applied = clamped - current_;
        current_ = clamped;
        return applied;
    }

private:
    int32_t max_;
    int32_t current_;
};

struct HealthTag {};
struct ManaTag {};

/// Vitality. current == 0 means the character is dead.
using HealthComponent = ResourcePool<HealthTag>;

/// Spendable energy (仙力).
using ManaComponent = ResourcePool<ManaTag>;

// -- ExperienceComponent ------------------------------------------------------

/// Cumulative experience. The stage is derived from the total on every read
/// and cannot be set independently.
class ExperienceComponent {
public:
    ExperienceComponent() = default;

    [[nodiscard]] int64_t Total() const noexcept { return total_; }

    [[nodiscard]] Stage CurrentStage() const noexcept {
        return ResolveStageLevel(total_).stage;
    }

    /// Add experience. The total saturates at the int64_t maximum.
    ///
    /// @return Every stage entered by this gain, in ascending order (empty if
    ///         no threshold was crossed), or InvalidArgument for a negative
    ///         delta.
    foundation::GameResult<std::vector<Stage>> Add(int64_t delta) {
        using foundation::ErrorCode;
        using foundation::GameError;
        using Ret = foundation::GameResult<std::vector<Stage>>;

        if (delta < 0) {
            return Ret::err(GameError(ErrorCode::InvalidArgument,
                                      "experience delta must be non-negative, got "
                                          + std::to_string(delta)));
        }

        auto before = static_cast<std::size_t>(CurrentStage());
        total_ = delta > std::numeric_limits<int64_t>::max() - total_
                     ? std::numeric_limits<int64_t>::max()
                     : total_ + delta;
        auto after = static_cast<std::size_t>(CurrentStage());

        std::vector<Stage> crossed;
        for (auto i = before + 1; i <= after; ++i) {
            crossed.push_back(static_cast<Stage>(i));
        }
        return Ret::ok(std::move(crossed));
    }

private:
    int64_t total_ = 0;
};

// -- TalentComponent ----------------------------------------------------------

/// Fixed aptitude (资质) in [kMinTalent, kMaxTalent], set once at creation.
class TalentComponent {
public:
    [[nodiscard]] static foundation::GameResult<TalentComponent> Create(int32_t value) {
        using foundation::ErrorCode;
        using foundation::GameError;
        if (!IsValid(value)) {
            return foundation::GameResult<TalentComponent>::err(
                GameError(ErrorCode::InvalidArgument,
                          "talent must be in [" + std::to_string(kMinTalent) + ", "
                              + std::to_string(kMaxTalent) + "], got "
                              + std::to_string(value)));
        }
        return foundation::GameResult<TalentComponent>::ok(TalentComponent(value));
    }

    [[nodiscard]] static constexpr bool IsValid(int32_t value) noexcept {
        return value >= kMinTalent && value <= kMaxTalent;
    }

    [[nodiscard]] int32_t Value() const noexcept { return value_; }

private:
    explicit TalentComponent(int32_t value) noexcept : value_(value) {}

    int32_t value_;
};

// -- InventoryComponent -------------------------------------------------------

/// Consumable stock. The core never creates pills; only the difficulty's
/// starting stock seeds this component.
class InventoryComponent {
public:
    explicit InventoryComponent(uint32_t pills = 0) noexcept : pills_(pills) {}

    [[nodiscard]] uint32_t PillCount() const noexcept { return pills_; }
    [[nodiscard]] bool HasPills() const noexcept { return pills_ > 0; }

    /// Remove @p count pills.
    ///
    /// @return The remaining pill count, or InsufficientResource when fewer
    ///         than @p count are held (stock unchanged).
    foundation::GameResult<uint32_t> Consume(uint32_t count) {
        if (count > pills_) {
            return foundation::GameResult<uint32_t>::err(
                foundation::GameError(foundation::ErrorCode::InsufficientResource,
                                      "not enough pills: have " + std::to_string(pills_)
                                          + ", need " + std::to_string(count)));
        }
        pills_ -= count;
        return foundation::GameResult<uint32_t>::ok(pills_);
    }

private:
    uint32_t pills_;
};

}  // namespace cge::game
