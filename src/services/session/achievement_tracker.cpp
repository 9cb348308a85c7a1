/// @file achievement_tracker.cpp
/// @brief AchievementTracker: unlock rules over the session event stream.

#include "cge/service/achievement_tracker.hpp"

#include <string>

#include "cge/foundation/game_logger.hpp"
#include "cge/game/action_types.hpp"
#include "cge/service/session_manager.hpp"

namespace cge::service {

using cge::foundation::GameLogger;
using cge::foundation::LogCategory;
using cge::foundation::LogLevel;
using cge::game::EventKind;
using cge::game::LogEntry;

namespace {

int64_t payloadValue(const LogEntry& entry, const char* key) {
    if (!entry.payload) {
        return 0;
    }
    auto it = entry.payload->find(key);
    return it == entry.payload->end() ? 0 : it->second;
}

}  // namespace

AchievementTracker::AchievementTracker(SessionManager& manager) : source_(&manager.onEvent()) {
    slot_ = source_->connect([this](const LogEntry& entry) { observe(entry); });
}

AchievementTracker::~AchievementTracker() {
    if (source_ != nullptr) {
        source_->disconnect(slot_);
    }
}

void AchievementTracker::observe(const LogEntry& entry) {
    switch (entry.kind) {
        case EventKind::SessionStarted:
            // The welcome entry opens every session log.
            if (entry.sequence == 1) {
                reset();
            }
            break;

        case EventKind::ActionApplied: {
            auto totalActions = payloadValue(entry, "total_actions");
            if (totalActions >= 1) {
                unlock(AchievementId::FirstAction);
            }
            if (totalActions >= static_cast<int64_t>(kPersistentActionCount)) {
                unlock(AchievementId::PersistentCultivator);
            }

            auto action = payloadValue(entry, "action");
            if (action == static_cast<int64_t>(game::ActionKind::Cultivate)
                && ++cultivations_ >= kEnthusiastCultivationCount) {
                unlock(AchievementId::CultivationEnthusiast);
            }

            auto streak = payloadValue(entry, "meditation_streak");
            if (streak >= kMeditationBeginnerStreak) {
                unlock(AchievementId::MeditationBeginner);
            }
            if (streak >= kMeditationMasterStreak) {
                unlock(AchievementId::MeditationMaster);
            }
            break;
        }

        case EventKind::Breakthrough:
            unlock(AchievementId::FirstBreakthrough);
            break;

        case EventKind::GameOver:
            unlock(AchievementId::FirstDeath);
            break;

        case EventKind::ActionRejected:
        case EventKind::Ascended:
            break;
    }
}

void AchievementTracker::reset() {
    unlocked_.fill(false);
    order_.clear();
    cultivations_ = 0;
}

void AchievementTracker::unlock(AchievementId id) {
    auto idx = static_cast<std::size_t>(id);
    if (unlocked_[idx]) {
        return;
    }
    unlocked_[idx] = true;
    order_.push_back(id);

    const auto& info = GetAchievementInfo(id);
    GameLogger::instance().log(LogLevel::Info, LogCategory::Session,
                               "Achievement unlocked: " + std::string(info.key));
    unlockedSignal_.emit(id);
}

}  // namespace cge::service
