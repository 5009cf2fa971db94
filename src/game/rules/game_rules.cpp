/// @file game_rules.cpp
/// @brief LoadGameRules implementation.

#include "dcr/game/game_rules.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Overwrite @p target with the value at @p key when present.
template <typename T>
GameResult<void> readOptional(const ConfigManager& config,
                              std::string_view key, T& target) {
    if (!config.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    target = value.value();
    return GameResult<void>::ok();
}

GameResult<GameRules> invalid(std::string message) {
    DCR_LOG_ERROR(LogCategory::Config, message);
    return fail<GameRules>(ErrorCode::InvalidArgument, std::move(message));
}

} // namespace

GameResult<GameRules> LoadGameRules(const ConfigManager& config) {
    GameRules rules;

    const std::pair<std::string_view, double*> chances[] = {
        {"rules.encounter.near", &rules.nearEncounterChance},
        {"rules.encounter.mid", &rules.midEncounterChance},
        {"rules.encounter.far", &rules.farEncounterChance},
    };
    for (const auto& [key, target] : chances) {
        if (auto r = readOptional(config, key, *target); !r) {
            return GameResult<GameRules>::err(r.error());
        }
    }

    const std::pair<std::string_view, int32_t*> integers[] = {
        {"rules.encounter.guardian_min_distance", &rules.guardianMinDistance},
        {"rules.encounter.final_boss_min_distance", &rules.finalBossMinDistance},
        {"rules.encounter.guardian_level_bonus", &rules.guardianLevelBonus},
        {"rules.encounter.shadow_level_bonus", &rules.shadowLevelBonus},
        {"rules.bribe.gold_per_level", &rules.bribeGoldPerLevel},
        {"rules.tombstone.bonus", &rules.tombstoneBonus},
        {"rules.xp.base", &rules.xpBase},
        {"rules.gold.per_enemy_level", &rules.goldPerEnemyLevel},
        {"rules.status.burn_divisor", &rules.burnDivisor},
        {"rules.status.poison_divisor", &rules.poisonDivisor},
    };
    for (const auto& [key, target] : integers) {
        if (auto r = readOptional(config, key, *target); !r) {
            return GameResult<GameRules>::err(r.error());
        }
    }

    if (auto r = readOptional(config, "rules.encounter.special_spawn_one_in",
                              rules.specialSpawnOneIn); !r) {
        return GameResult<GameRules>::err(r.error());
    }

    for (const auto& key : config.keys("rules.")) {
        auto known = [&key](const auto& entry) { return entry.first == key; };
        if (std::none_of(std::begin(chances), std::end(chances), known) &&
            std::none_of(std::begin(integers), std::end(integers), known) &&
            key != "rules.encounter.special_spawn_one_in") {
            DCR_LOG_WARN(LogCategory::Config, "ignoring unknown rule " + key);
        }
    }

    for (const auto& [key, target] : chances) {
        if (*target < 0.0 || *target > 1.0) {
            return invalid(std::string(key) + " must be within [0, 1]");
        }
    }
    if (rules.nearEncounterChance > rules.midEncounterChance ||
        rules.midEncounterChance > rules.farEncounterChance) {
        return invalid("encounter chances must not decrease with distance");
    }
    if (rules.specialSpawnOneIn == 0) {
        return invalid("rules.encounter.special_spawn_one_in must be positive");
    }
    if (rules.burnDivisor <= 0 || rules.poisonDivisor <= 0) {
        return invalid("status divisors must be positive");
    }
    if (rules.bribeGoldPerLevel < 0 || rules.tombstoneBonus < 0 ||
        rules.xpBase <= 0 || rules.goldPerEnemyLevel < 0) {
        return invalid("reward and cost constants must not be negative");
    }

    return GameResult<GameRules>::ok(rules);
}

}  // namespace dcr::game
