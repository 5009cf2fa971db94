#pragma once

/// @file game_context.hpp
/// @brief Explicit replacement for global catalog/randomizer/rules state.
///
/// Initialization order:
///   1. ClassCatalog loaded (ClassCatalog::LoadFile / Parse)
///   2. GameRules loaded (LoadGameRules)
///   3. IRandomizer constructed (may reference the rules)
///   4. GameContext assembled; only then may a Game spawn anything.
/// The context only borrows; all three must outlive every Game using it.

#include "dcr/game/class_catalog.hpp"
#include "dcr/game/game_rules.hpp"
#include "dcr/game/randomizer.hpp"

namespace dcr::game {

struct GameContext {
    const ClassCatalog& catalog;
    IRandomizer& random;
    const GameRules& rules;
};

}  // namespace dcr::game
