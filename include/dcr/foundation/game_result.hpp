#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> and the fail() shorthand.

#include <string>

#include "dcr/core/result.hpp"
#include "dcr/foundation/game_error.hpp"

namespace dcr::foundation {

template <typename T>
using GameResult = dcr::Result<T, GameError>;

/// Shorthand for a rejected GameResult.
///
/// @code
///   if (amount > state.gold) {
///       return fail<NpcReport>(ErrorCode::InsufficientGold, "not enough gold");
///   }
/// @endcode
template <typename T>
[[nodiscard]] GameResult<T> fail(ErrorCode code, std::string message) {
    return GameResult<T>::err(GameError(code, std::move(message)));
}

}  // namespace dcr::foundation
