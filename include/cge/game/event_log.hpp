#pragma once

/// @file event_log.hpp
/// @brief EventLog: append-only, causally ordered record of session events.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cge::game {

/// Classification of a log entry.
enum class EventKind : uint8_t {
    SessionStarted,
    ActionApplied,
    ActionRejected,
    Breakthrough,
    GameOver,
    Ascended
};

constexpr std::string_view eventKindName(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::SessionStarted: return "SessionStarted";
        case EventKind::ActionApplied:  return "ActionApplied";
        case EventKind::ActionRejected: return "ActionRejected";
        case EventKind::Breakthrough:   return "Breakthrough";
        case EventKind::GameOver:       return "GameOver";
        case EventKind::Ascended:       return "Ascended";
    }
    return "Unknown";
}

/// Named integer fields attached to an entry (e.g. "health_delta" -> 7).
using EventPayload = std::map<std::string, int64_t>;

struct LogEntry {
    uint64_t sequence = 0;     ///< 1-based, strictly increasing within a session.
    EventKind kind = EventKind::ActionApplied;
    std::string message;
    std::optional<EventPayload> payload;
};

/// Session-scoped event log. Entries are never edited or removed; the log
/// is discarded together with its session.
class EventLog {
public:
    EventLog() = default;

    /// Append an entry and return a copy carrying its sequence number.
    LogEntry Append(EventKind kind, std::string message,
                    std::optional<EventPayload> payload = std::nullopt);

    [[nodiscard]] const std::vector<LogEntry>& Entries() const noexcept { return entries_; }

    /// The last @p count entries, oldest first.
    [[nodiscard]] std::vector<LogEntry> Recent(std::size_t count) const;

    /// Entries with a sequence number greater than @p sequence.
    [[nodiscard]] std::vector<LogEntry> Since(uint64_t sequence) const;

    /// Sequence number of the newest entry (0 when empty).
    [[nodiscard]] uint64_t LastSequence() const noexcept {
        return entries_.empty() ? 0 : entries_.back().sequence;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

private:
    std::vector<LogEntry> entries_;
};

}  // namespace cge::game
