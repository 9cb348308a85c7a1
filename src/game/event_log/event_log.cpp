/// @file event_log.cpp
/// @brief EventLog append and range queries.

#include "cge/game/event_log.hpp"

#include <algorithm>
#include <utility>

namespace cge::game {

LogEntry EventLog::Append(EventKind kind, std::string message,
                          std::optional<EventPayload> payload) {
    LogEntry entry;
    entry.sequence = LastSequence() + 1;
    entry.kind = kind;
    entry.message = std::move(message);
    entry.payload = std::move(payload);
    entries_.push_back(entry);
    return entry;
}

std::vector<LogEntry> EventLog::Recent(std::size_t count) const {
    auto n = std::min(count, entries_.size());
    return {entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end()};
}

std::vector<LogEntry> EventLog::Since(uint64_t sequence) const {
    // Sequence numbers are dense and 1-based, so entry i has sequence i + 1.
    if (sequence >= entries_.size()) {
        return {};
    }
    return {entries_.begin() + static_cast<std::ptrdiff_t>(sequence), entries_.end()};
}

}  // namespace cge::game
