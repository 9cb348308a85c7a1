#pragma once

/// @file progression_types.hpp
/// @brief Stage (境界) table, session phases, and progression constants.
///
/// The stage table is static data: cumulative experience thresholds,
/// strictly increasing, with exactly one terminal tier.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cge::game {

/// Ordered progression tiers.
enum class Stage : uint8_t {
    QiRefining,            ///< 炼气期
    Foundation,            ///< 筑基期
    CoreFormation,         ///< 结丹期
    NascentSoul,           ///< 元婴期
    SpiritTransformation,  ///< 化神期
    Ascension              ///< 飞升 (terminal)
};

inline constexpr std::size_t kStageCount = 6;

/// One row of the stage table.
struct StageLevel {
    Stage stage = Stage::QiRefining;
    uint32_t rank = 0;
    int64_t threshold = 0;  ///< Total experience required to enter the tier.
    bool terminal = false;
    std::string_view name;
    std::string_view displayName;
};

inline constexpr std::array<StageLevel, kStageCount> kStageTable = {{
    {Stage::QiRefining,           0, 0,    false, "QiRefining",           "炼气期"},
    {Stage::Foundation,           1, 100,  false, "Foundation",           "筑基期"},
    {Stage::CoreFormation,        2, 300,  false, "CoreFormation",        "结丹期"},
    {Stage::NascentSoul,          3, 700,  false, "NascentSoul",          "元婴期"},
    {Stage::SpiritTransformation, 4, 1500, false, "SpiritTransformation", "化神期"},
    {Stage::Ascension,            5, 3100, true,  "Ascension",            "飞升"},
}};

namespace detail {

constexpr bool stageTableIsWellFormed() {
    std::size_t terminals = 0;
    for (std::size_t i = 0; i < kStageCount; ++i) {
        if (kStageTable[i].rank != i || static_cast<std::size_t>(kStageTable[i].stage) != i) {
            return false;
        }
        if (i > 0 && kStageTable[i].threshold <= kStageTable[i - 1].threshold) {
            return false;
        }
        if (kStageTable[i].terminal) {
            ++terminals;
        }
    }
    return kStageTable[0].threshold == 0 && terminals == 1
        && kStageTable[kStageCount - 1].terminal;
}

}  // namespace detail

static_assert(detail::stageTableIsWellFormed(),
              "stage thresholds must start at 0, strictly increase, and end in one terminal tier");

/// Table row for a stage.
constexpr const StageLevel& GetStageLevel(Stage stage) noexcept {
    return kStageTable[static_cast<std::size_t>(stage)];
}

/// Highest tier whose threshold is <= @p totalExperience.
constexpr const StageLevel& ResolveStageLevel(int64_t totalExperience) noexcept {
    std::size_t idx = 0;
    for (std::size_t i = 1; i < kStageCount; ++i) {
        if (kStageTable[i].threshold <= totalExperience) {
            idx = i;
        }
    }
    return kStageTable[idx];
}

constexpr bool IsTerminalStage(Stage stage) noexcept {
    return GetStageLevel(stage).terminal;
}

constexpr std::string_view stageName(Stage stage) noexcept {
    return GetStageLevel(stage).name;
}

constexpr std::string_view stageDisplayName(Stage stage) noexcept {
    return GetStageLevel(stage).displayName;
}

/// Session life-cycle. Active is the only phase accepting actions.
enum class SessionPhase : uint8_t {
    Active,
    GameOver,
    Ascended
};

constexpr std::string_view sessionPhaseName(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Active:   return "Active";
        case SessionPhase::GameOver: return "GameOver";
        case SessionPhase::Ascended: return "Ascended";
    }
    return "Unknown";
}

constexpr bool IsTerminalPhase(SessionPhase phase) noexcept {
    return phase != SessionPhase::Active;
}

/// Talent (资质) bounds.
constexpr int32_t kMinTalent = 1;
constexpr int32_t kMaxTalent = 10;

}  // namespace cge::game
