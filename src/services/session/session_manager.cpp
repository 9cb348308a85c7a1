/// @file session_manager.cpp
/// @brief SessionManager implementation: session life cycle, action
///        protocol, event log and snapshots.

#include "cge/service/session_manager.hpp"

#include <algorithm>
#include <deque>
#include <random>
#include <string>
#include <utility>

#include "cge/foundation/error_code.hpp"
#include "cge/foundation/game_error.hpp"
#include "cge/foundation/game_logger.hpp"
#include "cge/game/character.hpp"

namespace cge::service {

using cge::foundation::ErrorCode;
using cge::foundation::GameError;
using cge::foundation::GameLogger;
using cge::foundation::GameResult;
using cge::foundation::LogCategory;
using cge::foundation::LogContext;
using cge::foundation::LogLevel;
using cge::foundation::SessionId;
using cge::game::ActionKind;
using cge::game::ActionOutcome;
using cge::game::ActionSystem;
using cge::game::EventKind;
using cge::game::EventPayload;
using cge::game::LogEntry;
using cge::game::SessionPhase;

namespace {

GameError noSession() {
    return GameError(ErrorCode::SessionNotStarted, "no session has been created");
}

LogContext contextFor(const SessionState& state) {
    LogContext ctx;
    ctx.sessionId = state.id;
    ctx.characterName = state.character.Name();
    return ctx;
}

std::string stageLabel(game::Stage stage) {
    return std::string(game::stageDisplayName(stage)) + " (" + std::string(game::stageName(stage))
           + ")";
}

}  // namespace

// -- Impl ---------------------------------------------------------------------

struct SessionManager::Impl {
    game::RuleEngine engine;
    std::optional<SessionState> session;
    foundation::Signal<const LogEntry&> events;
    uint64_t nextSessionId = 1;

    // Entries appended during a call are emitted only once the call is done
    // with the session, so a handler may end or restart it.
    std::deque<LogEntry> pending;
    bool flushing = false;

    explicit Impl(game::RuleSet rules) : engine(std::move(rules)) {}

    LogEntry append(SessionState& state, EventKind kind, std::string message,
                    std::optional<EventPayload> payload = std::nullopt) {
        auto entry = state.log.Append(kind, std::move(message), std::move(payload));
        pending.push_back(entry);
        return entry;
    }

    /// Emit pending entries in append order. A nested call made by a
    /// handler only queues; the outermost flush drains the queue.
    void flush() {
        if (flushing) {
            return;
        }
        struct FlushScope {
            bool& active;
            explicit FlushScope(bool& flag) : active(flag) { active = true; }
            ~FlushScope() { active = false; }
        } scope(flushing);

        while (!pending.empty()) {
            auto entry = std::move(pending.front());
            pending.pop_front();
            events.emit(entry);
        }
    }

    GameResult<SessionState> buildSession(const game::DifficultySettings& difficulty,
                                          SessionOptions options) {
        if (auto valid = difficulty.Validate(); !valid) {
            return GameResult<SessionState>::err(std::move(valid).error());
        }

        int32_t talent = 0;
        if (options.talent) {
            talent = *options.talent;
        } else {
            std::mt19937_64 rng(options.seed ? *options.seed : std::random_device{}());
            std::uniform_int_distribution<int32_t> dist(difficulty.talentRange.min,
                                                        difficulty.talentRange.max);
            talent = dist(rng);
        }

        auto character = game::Character::Create(options.characterName, talent, difficulty,
                                                 engine.Rules());
        if (!character) {
            return GameResult<SessionState>::err(std::move(character).error());
        }

        return GameResult<SessionState>::ok(SessionState{
            SessionId(nextSessionId++),
            difficulty,
            std::move(options),
            SessionPhase::Active,
            std::move(character).value(),
            game::EventLog{},
            SessionStatistics{}});
    }

    GameResult<StatusView> start(const game::DifficultySettings& difficulty,
                                 SessionOptions options) {
        auto built = buildSession(difficulty, std::move(options));
        if (!built) {
            GameLogger::instance().log(LogLevel::Warning, LogCategory::Session,
                                       "Session creation refused: "
                                           + std::string(built.error().message()));
            return GameResult<StatusView>::err(std::move(built).error());
        }

        session = std::move(built).value();
        auto& state = *session;
        const auto& character = state.character;

        append(state, EventKind::SessionStarted,
               "Welcome, " + character.Name() + ". Your path begins at " + state.difficulty.name
                   + " difficulty with " + std::to_string(character.Inventory().PillCount())
                   + " pill(s).",
               EventPayload{{"session_id", static_cast<int64_t>(state.id.value())},
                            {"pills", character.Inventory().PillCount()}});
        append(state, EventKind::SessionStarted,
               "Talent assessed: " + std::to_string(character.Talent().Value()) + "/"
                   + std::to_string(game::kMaxTalent) + ".",
               EventPayload{{"talent", character.Talent().Value()}});

        auto ctx = contextFor(state);
        ctx.extra["difficulty"] = state.difficulty.id;
        ctx.extra["talent"] = std::to_string(character.Talent().Value());
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                              "Session started", ctx);
        return GameResult<StatusView>::ok(buildStatus(state));
    }

    ActionResult reject(SessionState& state, ActionKind kind, GameError error) {
        ActionResult result;
        result.action = kind;
        result.accepted = false;
        result.summary = "Cannot " + std::string(game::GetActionInfo(kind).displayName) + ": "
                         + std::string(error.message());
        result.entries.push_back(append(
            state, EventKind::ActionRejected, result.summary,
            EventPayload{{"action", static_cast<int64_t>(kind)},
                         {"error_code", static_cast<int64_t>(error.code())}}));
        ++state.statistics.rejectedActions;

        auto ctx = contextFor(state);
        ctx.extra["action"] = std::string(game::actionName(kind));
        ctx.extra["error"] = std::string(foundation::errorCodeName(error.code()));
        GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Session,
                                              "Action rejected", ctx);

        result.error = std::move(error);
        result.status = buildStatus(state);
        return result;
    }

    ActionResult commit(SessionState& state, const ActionOutcome& outcome) {
        ActionResult result;
        result.action = outcome.kind;
        result.accepted = true;

        const auto& character = state.character;
        result.entries.push_back(append(
            state, EventKind::ActionApplied, ActionSystem::Describe(outcome),
            EventPayload{{"action", static_cast<int64_t>(outcome.kind)},
                         {"health_delta", outcome.healthDelta},
                         {"mana_delta", outcome.manaDelta},
                         {"experience_delta", outcome.experienceDelta},
                         {"pills_consumed", outcome.pillsConsumed},
                         {"health", character.Health().Current()},
                         {"mana", character.Mana().Current()},
                         {"total_experience", character.Experience().Total()},
                         {"total_actions", static_cast<int64_t>(character.TotalActions())},
                         {"meditation_streak", character.MeditationStreak()}}));

        for (auto stage : outcome.breakthroughs) {
            const auto& level = game::GetStageLevel(stage);
            result.entries.push_back(append(
                state, EventKind::Breakthrough, "Breakthrough! Entered " + stageLabel(stage) + ".",
                EventPayload{{"stage", level.rank}, {"threshold", level.threshold}}));
            GameLogger::instance().log(LogLevel::Info, LogCategory::Progression,
                                       "Breakthrough to " + std::string(game::stageName(stage)));
        }

        auto& stats = state.statistics;
        ++stats.acceptedActions[static_cast<std::size_t>(outcome.kind)];
        stats.pillsConsumed += outcome.pillsConsumed;
        stats.breakthroughs += outcome.breakthroughs.size();
        stats.longestMeditationStreak =
            std::max(stats.longestMeditationStreak, character.MeditationStreak());

        // Death takes precedence over ascension when both happen at once.
        if (outcome.died) {
            transition(state, SessionPhase::GameOver, result);
        } else if (outcome.reachedTerminalStage) {
            transition(state, SessionPhase::Ascended, result);
        }

        for (const auto& entry : result.entries) {
            if (!result.summary.empty()) {
                result.summary += ' ';
            }
            result.summary += entry.message;
        }
        result.outcome = outcome;
        result.status = buildStatus(state);
        return result;
    }

    void transition(SessionState& state, SessionPhase next, ActionResult& result) {
        state.phase = next;
        if (next == SessionPhase::GameOver) {
            result.entries.push_back(append(
                state, EventKind::GameOver,
                state.character.Name() + " has fallen. Game over; restart to begin anew.",
                EventPayload{{"total_actions",
                              static_cast<int64_t>(state.character.TotalActions())}}));
        } else {
            result.entries.push_back(append(
                state, EventKind::Ascended,
                state.character.Name() + " has ascended. The journey is complete.",
                EventPayload{{"total_actions",
                              static_cast<int64_t>(state.character.TotalActions())}}));
        }

        auto ctx = contextFor(state);
        ctx.extra["phase"] = std::string(game::sessionPhaseName(next));
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                              "Session phase changed", ctx);
    }

    StatusView buildStatus(const SessionState& state) const {
        auto status = state.character.Status();

        StatusView view;
        view.sessionId = state.id;
        view.difficultyName = state.difficulty.name;
        view.phase = state.phase;
        view.characterName = status.name;
        view.talent = status.talent;
        view.health = status.health;
        view.maxHealth = status.maxHealth;
        view.mana = status.mana;
        view.maxMana = status.maxMana;
        view.totalExperience = status.totalExperience;
        view.stage = status.stage;
        view.stageDisplayName = std::string(game::stageDisplayName(status.stage));
        if (auto next = game::RuleEngine::NextStageThreshold(status.stage); next) {
            view.nextThreshold = next.value();
        }
        view.progressPercent = game::RuleEngine::StageProgress(status.totalExperience);
        view.pills = status.pills;
        view.meditationStreak = status.meditationStreak;
        view.totalActions = status.totalActions;
        view.alive = status.alive;
        view.powerRating = engine.PowerRating(status);
        view.recommendation = engine.RecommendAction(status);
        view.recentEntries = state.log.Recent(engine.Rules().recentLogEntries);
        return view;
    }
};

// -- Construction -------------------------------------------------------------

SessionManager::SessionManager() : impl_(std::make_unique<Impl>(game::RuleSet{})) {}

SessionManager::SessionManager(game::RuleSet rules)
    : impl_(std::make_unique<Impl>(std::move(rules))) {}

SessionManager::~SessionManager() = default;

SessionManager::SessionManager(SessionManager&&) noexcept = default;
SessionManager& SessionManager::operator=(SessionManager&&) noexcept = default;

// -- Lifecycle ----------------------------------------------------------------

GameResult<StatusView> SessionManager::createSession(const game::DifficultySettings& difficulty,
                                                     SessionOptions options) {
    auto view = impl_->start(difficulty, std::move(options));
    impl_->flush();
    return view;
}

GameResult<StatusView> SessionManager::restart(const game::DifficultySettings& difficulty,
                                               SessionOptions options) {
    return createSession(difficulty, std::move(options));
}

GameResult<StatusView> SessionManager::restart() {
    if (!impl_->session) {
        return GameResult<StatusView>::err(noSession());
    }
    auto difficulty = impl_->session->difficulty;
    auto options = impl_->session->options;
    return createSession(difficulty, std::move(options));
}

void SessionManager::endSession() {
    if (impl_->session) {
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                              "Session ended", contextFor(*impl_->session));
    }
    impl_->session.reset();
}

bool SessionManager::hasSession() const noexcept {
    return impl_->session.has_value();
}

// -- Actions ------------------------------------------------------------------

GameResult<ActionResult> SessionManager::applyAction(const game::Action& action) {
    if (!impl_->session) {
        return GameResult<ActionResult>::err(noSession());
    }
    auto& state = *impl_->session;
    auto kind = game::KindOf(action);
    ActionSystem actions(impl_->engine, state.difficulty);

    ActionResult result;
    if (auto valid = actions.Validate(action, state.phase, state.character); !valid) {
        result = impl_->reject(state, kind, std::move(valid).error());
    } else {
        // Apply to a working copy so a failure leaves the character untouched.
        auto working = state.character;
        auto outcome = actions.Apply(action, working);
        if (outcome) {
            state.character = std::move(working);
            result = impl_->commit(state, outcome.value());
        } else {
            result = impl_->reject(state, kind, std::move(outcome).error());
        }
    }

    // Handlers run here; `state` must not be touched past this point.
    impl_->flush();
    return GameResult<ActionResult>::ok(std::move(result));
}

GameResult<ActionResult> SessionManager::applyAction(ActionKind kind) {
    return applyAction(game::MakeAction(kind));
}

GameResult<ActionOutcome> SessionManager::previewAction(const game::Action& action) const {
    if (!impl_->session) {
        return GameResult<ActionOutcome>::err(noSession());
    }
    const auto& state = *impl_->session;
    ActionSystem actions(impl_->engine, state.difficulty);

    if (auto valid = actions.Validate(action, state.phase, state.character); !valid) {
        return GameResult<ActionOutcome>::err(std::move(valid).error());
    }
    auto scratch = state.character;
    return actions.Apply(action, scratch);
}

std::vector<ActionKind> SessionManager::availableActions() const {
    std::vector<ActionKind> kinds;
    if (!impl_->session) {
        return kinds;
    }
    const auto& state = *impl_->session;
    ActionSystem actions(impl_->engine, state.difficulty);
    for (std::size_t i = 0; i < game::kActionKindCount; ++i) {
        auto kind = static_cast<ActionKind>(i);
        if (actions.Validate(game::MakeAction(kind), state.phase, state.character)) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

// -- Queries ------------------------------------------------------------------

GameResult<StatusView> SessionManager::snapshot() const {
    if (!impl_->session) {
        return GameResult<StatusView>::err(noSession());
    }
    return GameResult<StatusView>::ok(impl_->buildStatus(*impl_->session));
}

GameResult<SessionPhase> SessionManager::phase() const {
    if (!impl_->session) {
        return GameResult<SessionPhase>::err(noSession());
    }
    return GameResult<SessionPhase>::ok(impl_->session->phase);
}

GameResult<SessionStatistics> SessionManager::statistics() const {
    if (!impl_->session) {
        return GameResult<SessionStatistics>::err(noSession());
    }
    return GameResult<SessionStatistics>::ok(impl_->session->statistics);
}

std::optional<SessionId> SessionManager::sessionId() const {
    if (!impl_->session) {
        return std::nullopt;
    }
    return impl_->session->id;
}

std::vector<LogEntry> SessionManager::logEntries() const {
    if (!impl_->session) {
        return {};
    }
    return impl_->session->log.Entries();
}

const game::RuleEngine& SessionManager::rules() const noexcept {
    return impl_->engine;
}

foundation::Signal<const LogEntry&>& SessionManager::onEvent() noexcept {
    return impl_->events;
}

}  // namespace cge::service
