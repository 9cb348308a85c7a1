#pragma once

/// @file session_manager.hpp
/// @brief SessionManager: owner of the game session and its life cycle.
///
/// The session manager is the only component callers talk to. It owns the
/// SessionState (character, event log, phase) and runs one complete
/// validate, apply, log, transition cycle per applyAction() call.
///
/// Life cycle:
/// @code
///   Active --(health reaches 0)--------> GameOver
///   Active --(terminal stage reached)--> Ascended
/// @endcode
/// GameOver and Ascended accept nothing but restart.

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "cge/foundation/game_result.hpp"
#include "cge/foundation/signal.hpp"
#include "cge/foundation/types.hpp"
#include "cge/game/action_system.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/event_log.hpp"
#include "cge/game/progression_types.hpp"
#include "cge/game/rule_engine.hpp"
#include "cge/service/session_types.hpp"

namespace cge::service {

/// Single-session orchestrator.
///
/// Usage:
/// @code
///   SessionManager manager;
///   SessionOptions options;
///   options.talent = 5;
///   auto view = manager.createSession(game::NormalDifficulty(), options);
///
///   auto result = manager.applyAction(game::Cultivate{});
///   if (result && !result.value().accepted) {
///       // rejected; state unchanged, one ActionRejected entry appended
///   }
///
///   manager.onEvent().connect([](const game::LogEntry& e) { draw(e); });
///   manager.restart();
/// @endcode
class SessionManager {
public:
    SessionManager();
    explicit SessionManager(game::RuleSet rules);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) noexcept;
    SessionManager& operator=(SessionManager&&) noexcept;

    // -- Lifecycle ------------------------------------------------------------

    /// Start a new session, discarding any current one.
    ///
    /// @return InvalidArgument for invalid difficulty settings or a talent
    ///         override outside the difficulty's range. The current session
    ///         is kept on failure.
    [[nodiscard]] foundation::GameResult<StatusView> createSession(
        const game::DifficultySettings& difficulty, SessionOptions options = {});

    /// Replace the session with a fresh one built from @p difficulty.
    [[nodiscard]] foundation::GameResult<StatusView> restart(
        const game::DifficultySettings& difficulty, SessionOptions options = {});

    /// Replace the session with a fresh one using the same difficulty and options.
    /// @return SessionNotStarted if no session exists.
    [[nodiscard]] foundation::GameResult<StatusView> restart();

    /// Discard the current session (the quit signal).
    void endSession();

    [[nodiscard]] bool hasSession() const noexcept;

    // -- Actions --------------------------------------------------------------

    /// Run one action through the full protocol.
    ///
    /// @return SessionNotStarted when there is no session. Gameplay
    ///         rejections (InvalidPhase, InsufficientResource) are reported
    ///         inside ActionResult, not as an error.
    [[nodiscard]] foundation::GameResult<ActionResult> applyAction(const game::Action& action);
    [[nodiscard]] foundation::GameResult<ActionResult> applyAction(game::ActionKind kind);

    /// Compute what @p action would do without mutating or logging anything.
    [[nodiscard]] foundation::GameResult<game::ActionOutcome> previewAction(
        const game::Action& action) const;

    /// Actions whose preconditions hold right now; empty outside Active.
    [[nodiscard]] std::vector<game::ActionKind> availableActions() const;

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<StatusView> snapshot() const;
    [[nodiscard]] foundation::GameResult<game::SessionPhase> phase() const;
    [[nodiscard]] foundation::GameResult<SessionStatistics> statistics() const;
    [[nodiscard]] std::optional<foundation::SessionId> sessionId() const;

    /// Copy of the full event log; empty without a session.
    [[nodiscard]] std::vector<game::LogEntry> logEntries() const;

    [[nodiscard]] const game::RuleEngine& rules() const noexcept;

    /// Fired for every appended log entry, in append order, once the call
    /// that appended it is done with the session. Handlers may end, restart
    /// or act on the session.
    [[nodiscard]] foundation::Signal<const game::LogEntry&>& onEvent() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cge::service
