#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> observer used to stream engine events.
///
/// Header-only publish/subscribe. Slots are invoked in connection order.
/// The engine is single-threaded (one owner, one caller), so the signal
/// carries no synchronization.

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace cge::foundation {

/// Observer list dispatching to registered callbacks.
///
/// Example:
/// @code
///   Signal<const LogEntry&> onEvent;
///   auto id = onEvent.connect([](const LogEntry& e) { render(e); });
///   onEvent.emit(entry);
///   onEvent.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every registered slot with the given args.
    /// Slots are snapshotted first so a slot may connect or disconnect.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace cge::foundation
