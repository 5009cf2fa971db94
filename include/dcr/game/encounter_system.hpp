#pragma once

/// @file encounter_system.hpp
/// @brief Randomized enemy and NPC generation for a location.
///
/// Enemy generation, first applicable step wins:
///   1. Evade ring worn            -> nothing
///   2. ShouldEnemyAppear fails    -> nothing
///   3. Special spawns, in order   -> guardian, final boss, shadow, developer
///   4. Default random spawn       -> family pick, tier filter, level formula
///   5. EnemyLevel jitter on whatever level resulted
///
/// Each special spawn is a standalone static function so it can be
/// checked in isolation.

#include <cstdint>
#include <optional>

#include "dcr/game/character.hpp"
#include "dcr/game/encounter_types.hpp"
#include "dcr/game/game_context.hpp"
#include "dcr/game/game_state.hpp"
#include "dcr/game/location.hpp"
#include "dcr/game/quest_system.hpp"

namespace dcr::game {

class EncounterSystem {
public:
    static constexpr std::string_view kGuardianClass = "guardian";
    static constexpr std::string_view kFinalBossName = "overlord";
    static constexpr std::string_view kShadowName = "shadow";
    static constexpr std::string_view kDeveloperName = "developer";

    explicit EncounterSystem(const GameContext& ctx) : ctx_(ctx) {}

    /// Run the full priority chain. The returned level is already jittered.
    [[nodiscard]] std::optional<SpawnSpec> Generate(const Character& player,
                                                    const Location& location,
                                                    const QuestSystem& quests);

    /// Generate and instantiate an enemy.
    [[nodiscard]] std::optional<Character> SpawnEnemy(const GameState& state);

    /// Independent NPC roll: same appearance gate, uniform NPC choice.
    [[nodiscard]] std::optional<NpcKind> RollNpc(const Location& location);

    /// Fill an idle slot: enemy first, NPC only if no enemy appeared.
    /// @return The resulting state of the slot.
    EncounterState Populate(GameState& state);

    // ── Special spawns ─────────────────────────────────────────────────

    /// Guardian at player level + bonus while its quest is active and
    /// the distance is beyond the guardian threshold.
    [[nodiscard]] static std::optional<SpawnSpec> SpawnGuardian(
        const Character& player, Distance distance, const QuestSystem& quests,
        const ClassCatalog& catalog, const GameRules& rules);

    /// Doubled, legendary copy of the first player class, for wearers of
    /// the Ruling ring far enough from home.
    [[nodiscard]] static std::optional<SpawnSpec> SpawnFinalBoss(
        const Character& player, const Location& location,
        const ClassCatalog& catalog, const GameRules& rules);

    /// Rare copy of the player's own class at home, 1 in N.
    [[nodiscard]] static std::optional<SpawnSpec> SpawnShadow(
        const Character& player, const Location& location,
        IRandomizer& random, const GameRules& rules);

    /// Halved copy of the first player class in the data directory, 1 in N.
    [[nodiscard]] static std::optional<SpawnSpec> SpawnDeveloper(
        const Character& player, const Location& location,
        const ClassCatalog& catalog, IRandomizer& random, const GameRules& rules);

    /// Default spawn: random family, strongest eligible variant.
    /// nullopt only when the catalog has no enemy classes.
    [[nodiscard]] static std::optional<SpawnSpec> SpawnRandom(
        const Character& player, Distance distance,
        const ClassCatalog& catalog, IRandomizer& random);

    /// max(playerLevel / 10 + distance - 1, 1)
    [[nodiscard]] static constexpr int32_t RandomSpawnLevel(int32_t playerLevel,
                                                            Distance distance) noexcept {
        auto level = playerLevel / 10 + distance.len() - 1;
        return level > 1 ? level : 1;
    }

private:
    GameContext ctx_;
};

}  // namespace dcr::game
