#pragma once

/// @file game_rules.hpp
/// @brief Tunable gameplay constants and their YAML loader.

#include <cstdint>

#include "dcr/foundation/config_manager.hpp"
#include "dcr/foundation/game_result.hpp"

namespace dcr::game {

/// Gameplay constants. Defaults match the shipped config/dircrawl.yaml.
struct GameRules {
    // Encounter probability per distance band; must be non-decreasing.
    double nearEncounterChance = 1.0 / 3.0;
    double midEncounterChance = 1.0 / 2.0;
    double farEncounterChance = 2.0 / 3.0;

    uint32_t specialSpawnOneIn = 10;      ///< Mirror and easter-egg spawns.
    int32_t guardianMinDistance = 10;     ///< Boss needs len strictly above this.
    int32_t finalBossMinDistance = 100;   ///< Final boss needs len at or above this.
    int32_t guardianLevelBonus = 5;
    int32_t shadowLevelBonus = 3;

    int32_t bribeGoldPerLevel = 50;
    int32_t tombstoneBonus = 0;
    int32_t xpBase = 100;
    int32_t goldPerEnemyLevel = 50;

    int32_t burnDivisor = 20;    ///< Burn tick = max_hp / burnDivisor.
    int32_t poisonDivisor = 10;  ///< Poison tick = max_hp / poisonDivisor.
};

/// Build GameRules from the "rules.*" keys of a loaded configuration.
///
/// Missing keys keep their defaults; a present key of the wrong type is
/// ConfigTypeMismatch. Out-of-range values are InvalidArgument.
[[nodiscard]] foundation::GameResult<GameRules> LoadGameRules(
    const foundation::ConfigManager& config);

}  // namespace dcr::game
