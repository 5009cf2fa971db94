/// @file encounter_system.cpp
/// @brief EncounterSystem implementation.

#include "dcr/game/encounter_system.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <vector>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Special spawns ──────────────────────────────────────────────────────

std::optional<SpawnSpec> EncounterSystem::SpawnGuardian(
    const Character& player, Distance distance, const QuestSystem& quests,
    const ClassCatalog& catalog, const GameRules& rules) {
    if (!quests.IsActive(kGuardianQuestDescription) ||
        distance.len() <= rules.guardianMinDistance) {
        return std::nullopt;
    }
    const Class* guardian = catalog.Find(kGuardianClass);
    if (!guardian) {
        DCR_LOG_WARN(LogCategory::Encounter, "guardian quest active but no guardian class");
        return std::nullopt;
    }
    return SpawnSpec{*guardian, player.Level() + rules.guardianLevelBonus};
}

std::optional<SpawnSpec> EncounterSystem::SpawnFinalBoss(
    const Character& player, const Location& location,
    const ClassCatalog& catalog, const GameRules& rules) {
    if (!player.IsWearing(Ring::Ruling) ||
        location.DistanceFromHome().len() < rules.finalBossMinDistance) {
        return std::nullopt;
    }
    Class cls = catalog.PlayerFirst();
    cls.name = std::string(kFinalBossName);
    cls.hp.base *= 2;
    cls.strength.base *= 2;
    cls.category = Category::Legendary;
    return SpawnSpec{std::move(cls), player.Level()};
}

std::optional<SpawnSpec> EncounterSystem::SpawnShadow(
    const Character& player, const Location& location,
    IRandomizer& random, const GameRules& rules) {
    if (!location.IsHome() || !random.OneIn(rules.specialSpawnOneIn)) {
        return std::nullopt;
    }
    Class cls = player.GetClass();
    cls.name = std::string(kShadowName);
    cls.category = Category::Rare;
    return SpawnSpec{std::move(cls), player.Level() + rules.shadowLevelBonus};
}

std::optional<SpawnSpec> EncounterSystem::SpawnDeveloper(
    const Character& player, const Location& location,
    const ClassCatalog& catalog, IRandomizer& random, const GameRules& rules) {
    if (!location.IsDataDir() || !random.OneIn(rules.specialSpawnOneIn)) {
        return std::nullopt;
    }
    Class cls = catalog.PlayerFirst();
    cls.name = std::string(kDeveloperName);
    cls.hp.base = std::max(cls.hp.base / 2, 1);
    cls.strength.base /= 2;
    cls.speed.base /= 2;
    cls.category = Category::Rare;
    return SpawnSpec{std::move(cls), player.Level()};
}

std::optional<SpawnSpec> EncounterSystem::SpawnRandom(
    const Character& player, Distance distance,
    const ClassCatalog& catalog, IRandomizer& random) {
    // Ordered by family name so a given Range() roll is reproducible.
    std::map<std::string_view, std::vector<const Class*>> families;
    for (const Class* cls : catalog.Enemies()) {
        families[cls->BaseName()].push_back(cls);
    }
    if (families.empty()) {
        return std::nullopt;
    }

    auto pick = random.Range(static_cast<uint32_t>(families.size()));
    const auto& family = std::next(families.begin(), pick)->second;

    const Class* chosen = nullptr;
    for (const Class* variant : family) {
        if (player.Level() < categoryLevelRequirement(variant->category)) {
            continue;
        }
        if (!chosen || variant->hp.base > chosen->hp.base) {
            chosen = variant;
        }
    }
    if (!chosen) {
        chosen = family.front();
    }
    return SpawnSpec{*chosen, RandomSpawnLevel(player.Level(), distance)};
}

// ── Generation ──────────────────────────────────────────────────────────

std::optional<SpawnSpec> EncounterSystem::Generate(const Character& player,
                                                   const Location& location,
                                                   const QuestSystem& quests) {
    if (player.EnemiesEvaded()) {
        return std::nullopt;
    }
    auto distance = location.DistanceFromHome();
    if (!ctx_.random.ShouldEnemyAppear(distance)) {
        return std::nullopt;
    }

    auto spec = SpawnGuardian(player, distance, quests, ctx_.catalog, ctx_.rules);
    if (!spec) {
        spec = SpawnFinalBoss(player, location, ctx_.catalog, ctx_.rules);
    }
    if (!spec) {
        spec = SpawnShadow(player, location, ctx_.random, ctx_.rules);
    }
    if (!spec) {
        spec = SpawnDeveloper(player, location, ctx_.catalog, ctx_.random, ctx_.rules);
    }
    if (!spec) {
        spec = SpawnRandom(player, distance, ctx_.catalog, ctx_.random);
    }
    if (spec) {
        spec->level = std::max(ctx_.random.EnemyLevel(spec->level), 1);
    }
    return spec;
}

std::optional<Character> EncounterSystem::SpawnEnemy(const GameState& state) {
    auto spec = Generate(state.player, state.location, state.quests);
    if (!spec) {
        return std::nullopt;
    }
    Character enemy(std::move(spec->cls), spec->level);

    LogContext logCtx;
    logCtx.location = state.location.Path();
    logCtx.character = enemy.Name();
    logCtx.extra["level"] = std::to_string(enemy.Level());
    logCtx.extra["hp"] = std::to_string(enemy.Health());
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Encounter, "enemy appears", logCtx);
    return enemy;
}

std::optional<NpcKind> EncounterSystem::RollNpc(const Location& location) {
    if (!ctx_.random.ShouldEnemyAppear(location.DistanceFromHome())) {
        return std::nullopt;
    }
    auto kind = static_cast<NpcKind>(ctx_.random.Range(kNpcKindCount));
    DCR_LOG_INFO(LogCategory::Encounter,
                 "a " + std::string(npcKindName(kind)) + " approaches at " + location.Path());
    return kind;
}

EncounterState EncounterSystem::Populate(GameState& state) {
    if (state.Encounter() != EncounterState::Idle) {
        return state.Encounter();
    }
    if (auto enemy = SpawnEnemy(state)) {
        state.encounter = InCombat{std::move(*enemy)};
    } else if (auto npc = RollNpc(state.location)) {
        state.encounter = InNpcEncounter{*npc};
    }
    return state.Encounter();
}

}  // namespace dcr::game
