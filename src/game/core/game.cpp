/// @file game.cpp
/// @brief Game implementation: verb ordering, event dispatch, rewards.

#include "dcr/game/game.hpp"

#include <string>
#include <utility>

#include "dcr/foundation/game_logger.hpp"
#include "dcr/game/death_system.hpp"
#include "dcr/game/encounter_system.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// =============================================================================
// Impl
// =============================================================================

struct Game::Impl {
    GameContext ctx;
    GameState state;
    EncounterSystem encounters;
    CombatSystem combat;
    NpcSystem npcs;
    StatusEffectSystem status;
    DeathSystem death;
    GameStats stats;

    Impl(const GameContext& context, GameState initial)
        : ctx(context),
          state(std::move(initial)),
          encounters(context),
          combat(context),
          npcs(context),
          status(context),
          death(context) {}

    /// Deliver events to the quest list and credit completed rewards.
    std::vector<QuestCompletion> publish(const std::vector<Event>& events) {
        std::vector<QuestCompletion> completed;
        for (const auto& event : events) {
            if (std::holds_alternative<BattleWon>(event)) {
                ++stats.battlesWon;
            }
            for (auto& done : state.quests.Dispatch(event)) {
                state.gold += done.reward;
                ++stats.questsCompleted;

                LogContext logCtx;
                logCtx.character = state.player.Name();
                logCtx.extra["reward"] = std::to_string(done.reward);
                foundation::GameLogger::instance().logWithContext(
                    LogLevel::Info, LogCategory::Quest, "quest reward credited: " + done.description,
                    logCtx);
                completed.push_back(std::move(done));
            }
        }
        return completed;
    }

    /// Dispatch a combat verb's events, counting deaths on failure.
    GameResult<CombatReport> finish(GameResult<CombatReport> result) {
        if (result.hasError()) {
            if (result.error().isDeath()) {
                ++stats.deaths;
            } else {
                DCR_LOG_DEBUG(LogCategory::Combat, "rejected: " + result.error().describe());
            }
            return result;
        }
        auto& report = result.value();
        report.quests = publish(report.events);
        return result;
    }

    GameResult<NpcReport> finish(GameResult<NpcReport> result) {
        if (result.hasError()) {
            DCR_LOG_DEBUG(LogCategory::Encounter, "rejected: " + result.error().describe());
            return result;
        }
        auto& report = result.value();
        report.quests = publish(report.events);
        return result;
    }
};

// =============================================================================
// Construction
// =============================================================================

Game::Game(const GameContext& ctx)
    : Game(ctx, GameState::New(ctx.catalog)) {}

Game::Game(const GameContext& ctx, GameState state)
    : impl_(std::make_unique<Impl>(ctx, std::move(state))) {}

Game::~Game() = default;
Game::Game(Game&&) noexcept = default;
Game& Game::operator=(Game&&) noexcept = default;

// =============================================================================
// State
// =============================================================================

const GameState& Game::State() const noexcept { return impl_->state; }

GameState& Game::MutableState() noexcept { return impl_->state; }

GameState Game::Snapshot() const { return impl_->state; }

void Game::Restore(GameState state) {
    impl_->state = std::move(state);
    DCR_LOG_INFO(LogCategory::Core, "game state restored");
}

const GameStats& Game::Stats() const noexcept { return impl_->stats; }

// =============================================================================
// World
// =============================================================================

GameResult<MoveReport> Game::GoTo(const Location& location, bool force) {
    auto& state = impl_->state;
    if (state.Encounter() != EncounterState::Idle) {
        return fail<MoveReport>(ErrorCode::InvalidAction, "cannot leave during an encounter");
    }

    state.location = location;
    ++impl_->stats.moves;
    DCR_LOG_DEBUG(LogCategory::World, "arrived at " + location.Path());

    MoveReport report;
    report.statusTick = impl_->status.Apply(state.player);
    if (report.statusTick && report.statusTick->lethal) {
        ++impl_->stats.deaths;
        auto tombstone = impl_->death.Settle(state);
        return GameResult<MoveReport>::err(DeathSystem::DeathError(tombstone));
    }

    if (location.IsHome()) {
        state.player.RestoreFull();
        report.restored = true;
    }

    if (!force) {
        report.encounter = impl_->encounters.Populate(state);
    }
    return GameResult<MoveReport>::ok(std::move(report));
}

GameResult<EncounterState> Game::Battle() {
    auto& state = impl_->state;
    if (state.Encounter() != EncounterState::Idle) {
        return fail<EncounterState>(ErrorCode::EncounterInProgress, "already in an encounter");
    }
    if (auto enemy = impl_->encounters.SpawnEnemy(state)) {
        state.encounter = InCombat{std::move(*enemy)};
    }
    return GameResult<EncounterState>::ok(state.Encounter());
}

InspectReport Game::Inspect() {
    InspectReport report;
    auto events = impl_->death.Collect(impl_->state);
    report.tombstones = events.size();
    for (const auto& event : events) {
        report.goldFound += std::get<TombstoneFound>(event).gold;
    }
    report.quests = impl_->publish(events);
    return report;
}

void Game::Reset() {
    auto& state = impl_->state;
    state.location = Location::Home();
    state.ClearEncounter();
    state.player.RestoreFull();
    DCR_LOG_INFO(LogCategory::Core, "game reset");
}

// =============================================================================
// Combat
// =============================================================================

GameResult<CombatReport> Game::Attack() {
    return impl_->finish(impl_->combat.Attack(impl_->state));
}

GameResult<CombatReport> Game::Flee() {
    return impl_->finish(impl_->combat.Flee(impl_->state));
}

GameResult<CombatReport> Game::Bribe() {
    return impl_->finish(impl_->combat.Bribe(impl_->state));
}

GameResult<CombatReport> Game::UseSkill(std::string_view name) {
    return impl_->finish(impl_->combat.UseSkill(impl_->state, name));
}

// =============================================================================
// NPCs
// =============================================================================

GameResult<NpcReport> Game::Bet(int32_t amount) {
    return impl_->finish(impl_->npcs.Bet(impl_->state, amount));
}

GameResult<NpcReport> Game::Brew() {
    return impl_->finish(impl_->npcs.Brew(impl_->state));
}

GameResult<NpcReport> Game::Listen() {
    return impl_->finish(impl_->npcs.Listen(impl_->state));
}

// =============================================================================
// Character
// =============================================================================

GameResult<SkillId> Game::LearnSkill(std::string_view name) {
    return impl_->state.player.LearnSkill(name);
}

GameResult<ItemReport> Game::UseItem(ItemKey item) {
    auto& state = impl_->state;
    if (state.inventory.Count(item) == 0) {
        return fail<ItemReport>(ErrorCode::ItemNotFound,
                                "no " + std::string(itemName(item)) + " carried");
    }

    ItemReport report;
    report.item = item;
    auto& player = state.player;
    switch (item) {
        case ItemKey::Potion:
            report.healed = player.Heal(player.MaxHealth() / 2);
            break;
        case ItemKey::Remedy:
            report.cured = player.CureStatus();
            break;
        case ItemKey::Ether:
            report.manaRestored = player.RestoreMana(player.MaxMana() / 2);
            break;
        case ItemKey::Amulet:
            return fail<ItemReport>(ErrorCode::ItemNotUsable,
                                    std::string(itemName(item)) + " cannot be used");
    }
    state.inventory.Remove(item);
    DCR_LOG_DEBUG(LogCategory::Character, "used " + std::string(itemName(item)));
    return GameResult<ItemReport>::ok(std::move(report));
}

std::vector<QuestCompletion> Game::AddItem(ItemKey item) {
    impl_->state.inventory.Add(item);
    return impl_->publish({Event{ItemAdded{item}}});
}

GameResult<void> Game::ChangeClass(std::string_view name) {
    auto& state = impl_->state;
    if (!state.location.IsHome() || state.Encounter() != EncounterState::Idle) {
        return fail<void>(ErrorCode::InvalidAction, "classes can only be changed at home");
    }
    const Class* cls = impl_->ctx.catalog.Find(name, Category::Player);
    if (!cls) {
        return fail<void>(ErrorCode::ClassNotFound, "no player class named " + std::string(name));
    }

    state.player = Character(*cls, 1);
    DCR_LOG_INFO(LogCategory::Character, "class changed to " + cls->name);
    return GameResult<void>::ok();
}

}  // namespace dcr::game
