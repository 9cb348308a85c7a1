#pragma once

/// @file achievement_tracker.hpp
/// @brief AchievementTracker: session-scoped milestones derived from the
///        session event stream.
///
/// The tracker never touches session state. It subscribes to
/// SessionManager::onEvent() and unlocks milestones from the entries it
/// sees, starting over whenever a new session begins.

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "cge/foundation/signal.hpp"
#include "cge/game/event_log.hpp"

namespace cge::service {

class SessionManager;

/// Milestones a session can unlock, at most once each.
enum class AchievementId : uint8_t {
    FirstAction,            ///< 开始修炼: the first accepted action.
    PersistentCultivator,   ///< 坚持修炼: ten accepted actions.
    CultivationEnthusiast,  ///< 修炼爱好者: five accepted cultivations.
    FirstBreakthrough,      ///< 首次突破: the first stage breakthrough.
    MeditationBeginner,     ///< 打坐初学者: a meditation streak of five.
    MeditationMaster,       ///< 打坐大师: a meditation streak of ten.
    FirstDeath              ///< 初次死亡: the character has fallen.
};

inline constexpr std::size_t kAchievementCount = 7;

struct AchievementInfo {
    AchievementId id;
    std::string_view key;           ///< Stable identifier, e.g. "first_action".
    std::string_view displayName;   ///< e.g. "开始修炼".
};

inline constexpr std::array<AchievementInfo, kAchievementCount> kAchievementTable = {{
    {AchievementId::FirstAction,           "first_action",           "开始修炼"},
    {AchievementId::PersistentCultivator,  "persistent_cultivator",  "坚持修炼"},
    {AchievementId::CultivationEnthusiast, "cultivation_enthusiast", "修炼爱好者"},
    {AchievementId::FirstBreakthrough,     "first_breakthrough",     "首次突破"},
    {AchievementId::MeditationBeginner,    "meditation_beginner",    "打坐初学者"},
    {AchievementId::MeditationMaster,      "meditation_master",      "打坐大师"},
    {AchievementId::FirstDeath,            "first_death",            "初次死亡"},
}};

constexpr const AchievementInfo& GetAchievementInfo(AchievementId id) noexcept {
    return kAchievementTable[static_cast<std::size_t>(id)];
}

inline constexpr uint64_t kPersistentActionCount = 10;
inline constexpr uint64_t kEnthusiastCultivationCount = 5;
inline constexpr int64_t kMeditationBeginnerStreak = 5;
inline constexpr int64_t kMeditationMasterStreak = 10;

/// Observer that turns session events into unlocked achievements.
///
/// Usage:
/// @code
///   SessionManager manager;
///   AchievementTracker achievements(manager);
///   achievements.onUnlocked().connect([](AchievementId id) { toast(id); });
///   manager.createSession(game::NormalDifficulty());
///   manager.applyAction(game::Meditate{});   // unlocks FirstAction
/// @endcode
///
/// The manager must outlive the tracker.
class AchievementTracker {
public:
    explicit AchievementTracker(SessionManager& manager);
    ~AchievementTracker();

    AchievementTracker(const AchievementTracker&) = delete;
    AchievementTracker& operator=(const AchievementTracker&) = delete;
    AchievementTracker(AchievementTracker&&) = delete;
    AchievementTracker& operator=(AchievementTracker&&) = delete;

    /// Feed one log entry. Called for every entry the manager emits.
    void observe(const game::LogEntry& entry);

    [[nodiscard]] bool isUnlocked(AchievementId id) const noexcept {
        return unlocked_[static_cast<std::size_t>(id)];
    }

    /// Unlocked achievements of the current session, in unlock order.
    [[nodiscard]] const std::vector<AchievementId>& unlocked() const noexcept { return order_; }

    [[nodiscard]] std::size_t unlockedCount() const noexcept { return order_.size(); }

    /// Fired once per achievement per session, at the moment it unlocks.
    [[nodiscard]] foundation::Signal<AchievementId>& onUnlocked() noexcept { return unlockedSignal_; }

private:
    void reset();
    void unlock(AchievementId id);

    foundation::Signal<const game::LogEntry&>* source_ = nullptr;
    foundation::Signal<const game::LogEntry&>::SlotId slot_ = 0;

    std::array<bool, kAchievementCount> unlocked_{};
    std::vector<AchievementId> order_;
    uint64_t cultivations_ = 0;
    foundation::Signal<AchievementId> unlockedSignal_;
};

}  // namespace cge::service
