#pragma once

/// @file action_types.hpp
/// @brief The closed set of player actions and their catalogue entries.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "cge/foundation/game_result.hpp"

namespace cge::game {

/// Action discriminator. COUNT is a sentinel for array sizing.
enum class ActionKind : uint8_t {
    Meditate,
    ConsumePill,
    Cultivate,
    Wait,
    COUNT
};

inline constexpr std::size_t kActionKindCount = static_cast<std::size_t>(ActionKind::COUNT);

/// Catalogue entry describing an action to the input/render collaborator.
struct ActionInfo {
    ActionKind kind = ActionKind::Wait;
    std::string_view id;           ///< Stable identifier used by input bindings.
    std::string_view displayName;
    std::string_view description;
};

inline constexpr std::array<ActionInfo, kActionKindCount> kActionCatalogue = {{
    {ActionKind::Meditate,    "meditate",     "打坐",   "Enter meditation to restore health and mana"},
    {ActionKind::ConsumePill, "consume_pill", "吃丹药", "Swallow a pill for a fixed burst of health and mana"},
    {ActionKind::Cultivate,   "cultivate",    "修炼",   "Circulate the technique, spending mana for experience"},
    {ActionKind::Wait,        "wait",         "等待",   "Let time pass without effect"},
}};

constexpr const ActionInfo& GetActionInfo(ActionKind kind) noexcept {
    auto idx = static_cast<std::size_t>(kind);
    return kActionCatalogue[idx < kActionKindCount ? idx : kActionKindCount - 1];
}

constexpr std::string_view actionName(ActionKind kind) noexcept {
    return GetActionInfo(kind).id;
}

// -- Action variants ----------------------------------------------------------

struct Meditate {
    static constexpr ActionKind kKind = ActionKind::Meditate;
};

struct ConsumePill {
    static constexpr ActionKind kKind = ActionKind::ConsumePill;
};

struct Cultivate {
    static constexpr ActionKind kKind = ActionKind::Cultivate;
};

struct Wait {
    static constexpr ActionKind kKind = ActionKind::Wait;
};

/// A player action request. Dispatch is an exhaustive std::visit, so adding
/// an alternative without handling it everywhere fails to compile.
using Action = std::variant<Meditate, ConsumePill, Cultivate, Wait>;

static_assert(std::variant_size_v<Action> == kActionKindCount,
              "every ActionKind needs exactly one Action alternative");

constexpr ActionKind KindOf(const Action& action) noexcept {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::kKind; }, action);
}

/// Build the action for a kind. COUNT maps to Wait.
constexpr Action MakeAction(ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::Meditate:    return Meditate{};
        case ActionKind::ConsumePill: return ConsumePill{};
        case ActionKind::Cultivate:   return Cultivate{};
        case ActionKind::Wait:
        case ActionKind::COUNT:       break;
    }
    return Wait{};
}

/// Resolve a binding id ("meditate", "consume_pill", ...) to an action.
/// @return The action, or UnknownAction.
inline foundation::GameResult<Action> ParseActionId(std::string_view id) {
    for (const auto& info : kActionCatalogue) {
        if (info.id == id) {
            return foundation::GameResult<Action>::ok(MakeAction(info.kind));
        }
    }
    return foundation::GameResult<Action>::err(
        foundation::GameError(foundation::ErrorCode::UnknownAction,
                              "unknown action id: " + std::string(id)));
}

}  // namespace cge::game
