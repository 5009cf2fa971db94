/// @file combat_system.cpp
/// @brief CombatSystem implementation.

#include "dcr/game/combat_system.hpp"

#include <algorithm>
#include <string>

#include "dcr/foundation/game_logger.hpp"
#include "dcr/game/encounter_system.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

GameResult<CombatReport> noEnemy(std::string_view verb) {
    return fail<CombatReport>(ErrorCode::InvalidAction,
                              "there is no enemy to " + std::string(verb));
}

void logHit(const Character& attacker, const Character& defender, const HitResult& hit) {
    if (!foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        return;
    }
    LogContext logCtx;
    logCtx.character = attacker.Name();
    logCtx.extra["target"] = defender.Name();
    logCtx.extra["damage"] = std::to_string(hit.damage);
    logCtx.extra["target_hp"] = std::to_string(defender.Health());
    const char* what = hit.missed ? "misses" : (hit.critical ? "lands a critical hit" : "hits");
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::Combat, what, logCtx);
}

} // namespace

// ── Formulas ────────────────────────────────────────────────────────────

int32_t CombatSystem::CalculateDamage(int32_t base, bool isCritical) noexcept {
    auto damage = std::max(base, 1);
    return isCritical ? damage * 2 : damage;
}

int32_t CombatSystem::BribeCost(const Character& enemy, const GameRules& rules) noexcept {
    return rules.bribeGoldPerLevel * enemy.Level() *
           categoryMultiplier(enemy.GetClass().category);
}

int32_t CombatSystem::BaseExperience(const Character& player, const Character& enemy,
                                     const GameRules& rules) noexcept {
    int32_t base = 0;
    if (enemy.Level() >= player.Level()) {
        base = rules.xpBase * (1 + enemy.Level() - player.Level());
    } else {
        base = rules.xpBase / (1 + player.Level() - enemy.Level());
    }
    return std::max(base, 1) * categoryMultiplier(enemy.GetClass().category);
}

// ── Internals ───────────────────────────────────────────────────────────

HitResult CombatSystem::strike(const Character& attacker, Character& defender,
                               int32_t multiplier, bool neverMisses) {
    HitResult hit;
    if (!neverMisses && ctx_.random.IsMiss(attacker.Speed(), defender.Speed())) {
        hit.missed = true;
        logHit(attacker, defender, hit);
        return hit;
    }
    hit.critical = ctx_.random.IsCritical();
    hit.damage = CalculateDamage(ctx_.random.Damage(attacker.Strength() * multiplier),
                                 hit.critical);
    defender.ReceiveDamage(hit.damage);
    logHit(attacker, defender, hit);
    return hit;
}

GameResult<CombatReport> CombatSystem::retaliate(GameState& state, CombatReport report) {
    Character* enemy = state.Enemy();
    report.enemyHit = strike(*enemy, state.player, 1, false);

    if (!report.enemyHit->missed && !state.player.IsDead()) {
        const auto& inflicts = enemy->GetClass().inflicts;
        if (inflicts && ctx_.random.OneIn(inflicts->oneIn)) {
            state.player.Afflict(inflicts->effect);
            report.inflicted = inflicts->effect;
            DCR_LOG_INFO(LogCategory::Combat,
                         enemy->Name() + " inflicts " +
                         std::string(statusEffectName(inflicts->effect)));
        }
    }

    if (state.player.IsDead()) {
        auto tombstone = death_.Settle(state);
        return GameResult<CombatReport>::err(DeathSystem::DeathError(tombstone));
    }
    report.outcome = CombatOutcome::Continue;
    return GameResult<CombatReport>::ok(std::move(report));
}

CombatReport CombatSystem::victory(GameState& state, CombatReport report) {
    Character enemy = std::move(*state.Enemy());
    state.ClearEncounter();

    report.outcome = CombatOutcome::Victory;
    report.xpGained = ctx_.random.XpGained(BaseExperience(state.player, enemy, ctx_.rules));
    report.goldGained = ctx_.random.GoldGained(ctx_.rules.goldPerEnemyLevel * enemy.Level());
    state.gold += report.goldGained;

    report.events.emplace_back(BattleWon{enemy.Name(), enemy.Level(), enemy.GetClass().category});

    report.levelsGained = state.player.AddExperience(report.xpGained);
    if (report.levelsGained > 0) {
        report.events.emplace_back(LevelUp{state.player.Level()});
    }

    if (enemy.Name() == EncounterSystem::kGuardianClass) {
        report.loot = ItemKey::Amulet;
        state.inventory.Add(ItemKey::Amulet);
        report.events.emplace_back(ItemAdded{ItemKey::Amulet});
    }

    LogContext logCtx;
    logCtx.location = state.location.Path();
    logCtx.character = enemy.Name();
    logCtx.extra["xp"] = std::to_string(report.xpGained);
    logCtx.extra["gold"] = std::to_string(report.goldGained);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Combat, "enemy defeated", logCtx);
    return report;
}

// ── Verbs ───────────────────────────────────────────────────────────────

GameResult<CombatReport> CombatSystem::Attack(GameState& state) {
    Character* enemy = state.Enemy();
    if (!enemy) {
        return noEnemy("attack");
    }

    CombatReport report;
    report.playerHit = strike(state.player, *enemy, 1, false);
    if (enemy->IsDead()) {
        return GameResult<CombatReport>::ok(victory(state, std::move(report)));
    }
    return retaliate(state, std::move(report));
}

GameResult<CombatReport> CombatSystem::Flee(GameState& state) {
    Character* enemy = state.Enemy();
    if (!enemy) {
        return noEnemy("flee from");
    }

    if (ctx_.random.FleeSucceeds(state.player.Speed(), enemy->Speed())) {
        DCR_LOG_INFO(LogCategory::Combat, "escaped from " + enemy->Name());
        state.ClearEncounter();
        CombatReport report;
        report.outcome = CombatOutcome::Disengaged;
        return GameResult<CombatReport>::ok(std::move(report));
    }
    DCR_LOG_DEBUG(LogCategory::Combat, "failed to flee from " + enemy->Name());
    return retaliate(state, CombatReport{});
}

GameResult<CombatReport> CombatSystem::Bribe(GameState& state) {
    Character* enemy = state.Enemy();
    if (!enemy) {
        return noEnemy("bribe");
    }

    auto cost = BribeCost(*enemy, ctx_.rules);
    if (state.gold < cost) {
        return fail<CombatReport>(ErrorCode::InsufficientGold,
                      enemy->Name() + " wants " + std::to_string(cost) + " gold");
    }

    if (ctx_.random.BribeSucceeds(state.player.Level(), enemy->Level())) {
        DCR_LOG_INFO(LogCategory::Combat,
                     "bribed " + enemy->Name() + " with " + std::to_string(cost) + " gold");
        state.gold -= cost;
        state.ClearEncounter();
        CombatReport report;
        report.outcome = CombatOutcome::Disengaged;
        report.goldSpent = cost;
        return GameResult<CombatReport>::ok(std::move(report));
    }
    DCR_LOG_DEBUG(LogCategory::Combat, enemy->Name() + " refuses the bribe");
    return retaliate(state, CombatReport{});
}

GameResult<CombatReport> CombatSystem::UseSkill(GameState& state, std::string_view name) {
    const SkillDef* skill = FindSkill(name);
    if (!skill) {
        return fail<CombatReport>(ErrorCode::UnknownSkill, "unknown skill: " + std::string(name));
    }
    if (!state.player.KnowsSkill(skill->id)) {
        return fail<CombatReport>(ErrorCode::SkillNotLearned,
                                  "skill not learned: " + std::string(name));
    }
    Character* enemy = state.Enemy();
    if (skill->kind == SkillKind::Offensive && !enemy) {
        return noEnemy("use " + std::string(name) + " on");
    }
    if (!state.player.SpendMana(skill->manaCost)) {
        return fail<CombatReport>(ErrorCode::InsufficientResources,
                      std::string(name) + " needs " + std::to_string(skill->manaCost) + " mana");
    }

    CombatReport report;
    switch (skill->id) {
        case SkillId::PowerStrike:
        case SkillId::Fireball:
            report.playerHit = strike(state.player, *enemy, skill->strengthMultiplier,
                                      skill->neverMisses);
            if (enemy->IsDead()) {
                return GameResult<CombatReport>::ok(victory(state, std::move(report)));
            }
            break;
        case SkillId::Heal:
            report.healed = state.player.Heal(state.player.MaxHealth() / 2);
            break;
        case SkillId::Cleanse:
            state.player.CureStatus();
            break;
    }

    if (!enemy) {
        return GameResult<CombatReport>::ok(std::move(report));
    }
    return retaliate(state, std::move(report));
}

}  // namespace dcr::game
