#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the engine.

#include <compare>
#include <cstdint>
#include <functional>

namespace cge::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct SessionIdTag {};

/// Identifier of one game session; a restart always yields a new one.
using SessionId = StrongId<SessionIdTag>;

} // namespace cge::foundation

template <typename Tag, typename T>
struct std::hash<cge::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cge::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
