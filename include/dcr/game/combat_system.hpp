#pragma once

/// @file combat_system.hpp
/// @brief Turn-based combat verbs over the InCombat encounter slot.
///
/// Every verb is all-or-nothing until its first roll: a rejected verb
/// (wrong state, missing skill, not enough gold or mana) leaves the state
/// untouched. Once rolls begin the verb runs to one of:
///   Continue    - both sides still standing
///   Victory     - enemy defeated, rewards granted, slot cleared
///   Disengaged  - fled or bribed, slot cleared, no rewards
///   death       - CharacterDead error after DeathSystem::Settle

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "dcr/foundation/game_result.hpp"
#include "dcr/game/character.hpp"
#include "dcr/game/death_system.hpp"
#include "dcr/game/game_context.hpp"
#include "dcr/game/game_state.hpp"
#include "dcr/game/quest_system.hpp"
#include "dcr/game/quest_types.hpp"

namespace dcr::game {

enum class CombatOutcome : uint8_t {
    Continue,
    Victory,
    Disengaged
};

/// One landed or missed blow.
struct HitResult {
    int32_t damage = 0;
    bool critical = false;
    bool missed = false;
};

/// Everything a verb did, for the presentation layer and quest dispatch.
struct CombatReport {
    CombatOutcome outcome = CombatOutcome::Continue;
    std::optional<HitResult> playerHit;
    std::optional<HitResult> enemyHit;
    std::optional<StatusEffect> inflicted;
    int32_t healed = 0;
    int32_t xpGained = 0;
    int32_t goldGained = 0;
    int32_t goldSpent = 0;
    int32_t levelsGained = 0;
    std::optional<ItemKey> loot;
    std::vector<Event> events;
    /// Filled by Game after dispatching @c events.
    std::vector<QuestCompletion> quests;
};

class CombatSystem {
public:
    explicit CombatSystem(const GameContext& ctx) : ctx_(ctx), death_(ctx) {}

    /// Player strikes; a surviving enemy strikes back.
    foundation::GameResult<CombatReport> Attack(GameState& state);

    /// Speed-based escape; a failed attempt gives the enemy a free strike.
    foundation::GameResult<CombatReport> Flee(GameState& state);

    /// Pay the enemy off. InsufficientGold rejects without side effects;
    /// a refused bribe keeps the gold and draws a retaliation strike.
    foundation::GameResult<CombatReport> Bribe(GameState& state);

    /// Use a learned skill.
    ///
    /// Errors, checked in order and before any mutation: UnknownSkill,
    /// SkillNotLearned, InvalidAction (offensive skill without enemy),
    /// InsufficientResources.
    foundation::GameResult<CombatReport> UseSkill(GameState& state, std::string_view name);

    /// Base damage of one hit: at least 1, doubled on a critical.
    [[nodiscard]] static int32_t CalculateDamage(int32_t base, bool isCritical) noexcept;

    /// Gold asked by @p enemy: per-level rate x level x tier multiplier.
    [[nodiscard]] static int32_t BribeCost(const Character& enemy, const GameRules& rules) noexcept;

    /// Experience before jitter for beating @p enemy.
    [[nodiscard]] static int32_t BaseExperience(const Character& player, const Character& enemy,
                                                const GameRules& rules) noexcept;

private:
    /// Resolve one blow from @p attacker on @p defender.
    HitResult strike(const Character& attacker, Character& defender,
                     int32_t multiplier, bool neverMisses);

    /// Enemy's strike on the player, with possible status infliction.
    /// Settles the death and returns CharacterDead if it kills.
    foundation::GameResult<CombatReport> retaliate(GameState& state, CombatReport report);

    /// Grant rewards and clear the slot.
    CombatReport victory(GameState& state, CombatReport report);

    GameContext ctx_;
    DeathSystem death_;
};

}  // namespace dcr::game
