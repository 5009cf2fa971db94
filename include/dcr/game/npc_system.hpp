#pragma once

/// @file npc_system.hpp
/// @brief The single verb each NPC answers to.
///
///   Gambler       -> Bet     coin flip, doubles or loses the stake
///   Witch         -> Brew    hands over a Potion
///   GhostlyMaiden -> Listen  one of three lore lines
///
/// A verb aimed at the wrong NPC (or at nobody) is InvalidAction and
/// changes nothing. Any accepted verb ends the encounter.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "dcr/foundation/game_result.hpp"
#include "dcr/game/game_context.hpp"
#include "dcr/game/game_state.hpp"
#include "dcr/game/quest_system.hpp"
#include "dcr/game/quest_types.hpp"

namespace dcr::game {

struct NpcReport {
    NpcKind npc = NpcKind::Gambler;
    /// Net gold change (negative on a lost bet).
    int32_t goldDelta = 0;
    std::string message;
    std::vector<Event> events;
    std::vector<QuestCompletion> quests;
};

class NpcSystem {
public:
    static constexpr std::array<std::string_view, 3> kLore = {
        "The guardian waits far from home for those who seek it.",
        "They say a ring of ruling calls something ancient from the deep.",
        "Every fallen hero leaves their gold where they fell."
    };

    explicit NpcSystem(const GameContext& ctx) : ctx_(ctx) {}

    /// Errors: InvalidAction, InvalidArgument (amount <= 0),
    /// InsufficientGold (amount above carried gold).
    foundation::GameResult<NpcReport> Bet(GameState& state, int32_t amount);

    foundation::GameResult<NpcReport> Brew(GameState& state);

    foundation::GameResult<NpcReport> Listen(GameState& state);

private:
    GameContext ctx_;
};

}  // namespace dcr::game
