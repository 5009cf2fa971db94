#pragma once

/// @file game.hpp
/// @brief Game: one player's session, the entry point for every verb.
///
/// Game owns the GameState and wires the encounter, combat, NPC, status
/// effect, death and quest systems together. Each verb is one player
/// action run to completion in a fixed order:
///
///   action -> status tick -> death pipeline -> encounter -> event dispatch
///
/// Quest rewards are credited as part of the same verb. A CharacterDead
/// error means the death has already been settled (tombstone written,
/// hero reset); the caller is expected to follow up with Reset().

#include "dcr/foundation/game_result.hpp"
#include "dcr/game/combat_system.hpp"
#include "dcr/game/game_context.hpp"
#include "dcr/game/game_state.hpp"
#include "dcr/game/npc_system.hpp"
#include "dcr/game/status_effect_system.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace dcr::game {

// -- Reports ------------------------------------------------------------------

/// What happened on arrival.
struct MoveReport {
    std::optional<StatusTick> statusTick;
    /// Arrived home and got health and mana back.
    bool restored = false;
    EncounterState encounter = EncounterState::Idle;
};

struct InspectReport {
    std::size_t tombstones = 0;
    int32_t goldFound = 0;
    std::vector<QuestCompletion> quests;
};

struct ItemReport {
    ItemKey item = ItemKey::Potion;
    int32_t healed = 0;
    int32_t manaRestored = 0;
    bool cured = false;
};

/// Counters over the lifetime of one Game object.
struct GameStats {
    uint64_t moves = 0;
    uint64_t battlesWon = 0;
    uint64_t deaths = 0;
    uint64_t questsCompleted = 0;
};

// -- Game ---------------------------------------------------------------------

/// Usage:
/// @code
///   auto catalog = ClassCatalog::LoadFile("data/classes.yaml");
///   auto rules = LoadGameRules(config);
///   DefaultRandomizer random(rules.value());
///   GameContext ctx{catalog.value(), random, rules.value()};
///
///   Game game(ctx);
///   auto moved = game.GoTo(Location("~/src", Distance(1)));
///   if (moved && moved.value().encounter == EncounterState::InCombat) {
///       auto r = game.Attack();
///       if (!r && r.error().isDeath()) {
///           game.Reset();
///       }
///   }
/// @endcode
class Game {
public:
    /// New game: level-1 hero of the first player class at home.
    explicit Game(const GameContext& ctx);

    /// Resume from a previously snapshotted state.
    Game(const GameContext& ctx, GameState state);

    ~Game();

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;
    Game(Game&&) noexcept;
    Game& operator=(Game&&) noexcept;

    // -- State ----------------------------------------------------------------

    [[nodiscard]] const GameState& State() const noexcept;

    /// Direct access for loading and setup (rings, items from outside).
    [[nodiscard]] GameState& MutableState() noexcept;

    /// Copy of the full state, for the persistence layer.
    [[nodiscard]] GameState Snapshot() const;

    void Restore(GameState state);

    [[nodiscard]] const GameStats& Stats() const noexcept;

    // -- World ----------------------------------------------------------------

    /// Move to @p location.
    ///
    /// Rejected with InvalidAction while any encounter is active. With
    /// @p force no encounter is rolled, but status effects still tick and
    /// can kill.
    [[nodiscard]] foundation::GameResult<MoveReport> GoTo(const Location& location,
                                                          bool force = false);

    /// Look for a fight where the hero stands.
    /// @return InCombat if an enemy appeared, Idle otherwise.
    [[nodiscard]] foundation::GameResult<EncounterState> Battle();

    /// Pick up any tombstones at the current location.
    [[nodiscard]] InspectReport Inspect();

    /// Send the hero home with the encounter slot cleared. Used after
    /// CharacterDead; quests, tombstones and inventory are kept.
    void Reset();

    // -- Combat ---------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<CombatReport> Attack();
    [[nodiscard]] foundation::GameResult<CombatReport> Flee();
    [[nodiscard]] foundation::GameResult<CombatReport> Bribe();
    [[nodiscard]] foundation::GameResult<CombatReport> UseSkill(std::string_view name);

    // -- NPCs -----------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<NpcReport> Bet(int32_t amount);
    [[nodiscard]] foundation::GameResult<NpcReport> Brew();
    [[nodiscard]] foundation::GameResult<NpcReport> Listen();

    // -- Character ------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<SkillId> LearnSkill(std::string_view name);

    /// Errors: ItemNotFound (none carried), ItemNotUsable (quest items).
    [[nodiscard]] foundation::GameResult<ItemReport> UseItem(ItemKey item);

    /// Give the hero an item, emitting ItemAdded.
    std::vector<QuestCompletion> AddItem(ItemKey item);

    /// Restart as level 1 of another player class. Home only.
    ///
    /// Errors: InvalidAction (away from home or in an encounter),
    /// ClassNotFound (unknown name or not a player class).
    [[nodiscard]] foundation::GameResult<void> ChangeClass(std::string_view name);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dcr::game
