#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "cge/core/result.hpp"
#include "cge/foundation/game_error.hpp"

namespace cge::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<uint32_t> consumePill(uint32_t pills) {
///       if (pills == 0) {
///           return GameResult<uint32_t>::err(
///               GameError(ErrorCode::InsufficientResource, "no pills left"));
///       }
///       return GameResult<uint32_t>::ok(pills - 1);
///   }
/// @endcode
template <typename T>
using GameResult = cge::Result<T, GameError>;

}  // namespace cge::foundation
