#pragma once

/// @file death_system.hpp
/// @brief Death settlement and tombstone recovery.

#include <cstdint>
#include <vector>

#include "dcr/foundation/game_error.hpp"
#include "dcr/game/game_context.hpp"
#include "dcr/game/game_state.hpp"
#include "dcr/game/quest_types.hpp"
#include "dcr/game/tombstone_ledger.hpp"

namespace dcr::game {

class DeathSystem {
public:
    explicit DeathSystem(const GameContext& ctx) : ctx_(ctx) {}

    /// Settle a death, all at once:
    ///   - a tombstone with every carried coin at the current location
    ///   - a fresh level-1 hero of the same class, 0 xp, 0 gold
    ///   - the encounter slot cleared
    /// The hero stays where it fell; Game::Reset sends it home.
    Tombstone Settle(GameState& state);

    /// The CharacterDead error carrying @p tombstone as context.
    [[nodiscard]] static foundation::GameError DeathError(const Tombstone& tombstone);

    /// Pick up every tombstone at the current location, crediting its gold
    /// plus the configured bonus.
    /// @return One TombstoneFound event per stone.
    std::vector<Event> Collect(GameState& state);

private:
    GameContext ctx_;
};

}  // namespace dcr::game
