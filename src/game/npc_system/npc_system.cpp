/// @file npc_system.cpp
/// @brief NpcSystem implementation.

#include "dcr/game/npc_system.hpp"

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Ok if the slot holds @p kind, InvalidAction otherwise.
GameResult<void> expectNpc(const GameState& state, NpcKind kind) {
    const auto* npc = std::get_if<InNpcEncounter>(&state.encounter);
    if (!npc || npc->kind != kind) {
        return fail<void>(ErrorCode::InvalidAction,
                          "there is no " + std::string(npcKindName(kind)) + " here");
    }
    return GameResult<void>::ok();
}

} // namespace

GameResult<NpcReport> NpcSystem::Bet(GameState& state, int32_t amount) {
    if (auto check = expectNpc(state, NpcKind::Gambler); check.hasError()) {
        return GameResult<NpcReport>::err(check.error());
    }
    if (amount <= 0) {
        return fail<NpcReport>(ErrorCode::InvalidArgument, "bet must be positive");
    }
    if (amount > state.gold) {
        return fail<NpcReport>(ErrorCode::InsufficientGold,
                               "not enough gold to bet " + std::to_string(amount));
    }

    NpcReport report;
    report.npc = NpcKind::Gambler;
    if (ctx_.random.Range(2) == 0) {
        report.goldDelta = amount;
        report.message = "you win " + std::to_string(amount) + " gold";
    } else {
        report.goldDelta = -amount;
        report.message = "you lose " + std::to_string(amount) + " gold";
    }
    state.gold += report.goldDelta;
    state.ClearEncounter();
    DCR_LOG_INFO(LogCategory::Encounter, "gambler: " + report.message);
    return GameResult<NpcReport>::ok(std::move(report));
}

GameResult<NpcReport> NpcSystem::Brew(GameState& state) {
    if (auto check = expectNpc(state, NpcKind::Witch); check.hasError()) {
        return GameResult<NpcReport>::err(check.error());
    }

    NpcReport report;
    report.npc = NpcKind::Witch;
    report.message = "the witch brews you a potion";
    state.inventory.Add(ItemKey::Potion);
    report.events.emplace_back(ItemAdded{ItemKey::Potion});
    state.ClearEncounter();
    DCR_LOG_INFO(LogCategory::Encounter, report.message);
    return GameResult<NpcReport>::ok(std::move(report));
}

GameResult<NpcReport> NpcSystem::Listen(GameState& state) {
    if (auto check = expectNpc(state, NpcKind::GhostlyMaiden); check.hasError()) {
        return GameResult<NpcReport>::err(check.error());
    }

    NpcReport report;
    report.npc = NpcKind::GhostlyMaiden;
    report.message = std::string(kLore[ctx_.random.Range(static_cast<uint32_t>(kLore.size()))]);
    state.ClearEncounter();
    DCR_LOG_DEBUG(LogCategory::Encounter, "ghostly maiden: " + report.message);
    return GameResult<NpcReport>::ok(std::move(report));
}

}  // namespace dcr::game
