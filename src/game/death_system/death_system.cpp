/// @file death_system.cpp
/// @brief DeathSystem implementation.

#include "dcr/game/death_system.hpp"

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

Tombstone DeathSystem::Settle(GameState& state) {
    Tombstone tombstone{state.location.Path(), state.gold};
    state.tombstones.Add(tombstone);

    state.player = Character(state.player.GetClass(), 1);
    state.gold = 0;
    state.ClearEncounter();

    LogContext logCtx;
    logCtx.location = tombstone.location;
    logCtx.character = state.player.Name();
    logCtx.extra["gold"] = std::to_string(tombstone.gold);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Warning, LogCategory::World, "hero died", logCtx);
    return tombstone;
}

GameError DeathSystem::DeathError(const Tombstone& tombstone) {
    return GameError(ErrorCode::CharacterDead,
                     "hero died at " + tombstone.location, tombstone);
}

std::vector<Event> DeathSystem::Collect(GameState& state) {
    std::vector<Event> events;
    for (const auto& tombstone : state.tombstones.TakeAt(state.location.Path())) {
        auto gold = tombstone.gold + ctx_.rules.tombstoneBonus;
        state.gold += gold;
        events.emplace_back(TombstoneFound{gold});
        DCR_LOG_INFO(LogCategory::World,
                     "found a tombstone with " + std::to_string(gold) + " gold");
    }
    return events;
}

}  // namespace dcr::game
