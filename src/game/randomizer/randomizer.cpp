/// @file randomizer.cpp
/// @brief DefaultRandomizer implementation.

#include "dcr/game/randomizer.hpp"

#include <algorithm>
#include <cmath>

namespace dcr::game {

DefaultRandomizer::DefaultRandomizer(const GameRules& rules)
    : DefaultRandomizer(rules, std::random_device{}()) {}

DefaultRandomizer::DefaultRandomizer(const GameRules& rules, uint64_t seed)
    : rules_(rules), engine_(seed) {}

// ── Pure probability helpers ────────────────────────────────────────────

double DefaultRandomizer::EncounterChance(const GameRules& rules, Distance distance) {
    switch (distance.band()) {
        case DistanceBand::Near: return rules.nearEncounterChance;
        case DistanceBand::Mid:  return rules.midEncounterChance;
        case DistanceBand::Far:  return rules.farEncounterChance;
    }
    return rules.farEncounterChance;
}

double DefaultRandomizer::FleeChance(int32_t playerSpeed, int32_t enemySpeed) {
    auto fastest = std::max({playerSpeed, enemySpeed, 1});
    double chance = 0.5 + static_cast<double>(playerSpeed - enemySpeed) / (2.0 * fastest);
    return std::clamp(chance, 0.1, 0.9);
}

double DefaultRandomizer::BribeChance(int32_t playerLevel, int32_t enemyLevel) {
    double chance = 0.75 - 0.05 * static_cast<double>(enemyLevel - playerLevel);
    return std::clamp(chance, 0.1, 0.95);
}

double DefaultRandomizer::MissChance(int32_t attackerSpeed, int32_t defenderSpeed) {
    if (defenderSpeed <= attackerSpeed) {
        return 0.0;
    }
    // Grows with the speed gap, capped so every hit keeps a fair chance.
    double gap = static_cast<double>(defenderSpeed - attackerSpeed) / defenderSpeed;
    return std::min(gap / 2.0, 0.4);
}

// ── IRandomizer ─────────────────────────────────────────────────────────

bool DefaultRandomizer::ShouldEnemyAppear(Distance distance) {
    return roll(EncounterChance(rules_, distance));
}

int32_t DefaultRandomizer::EnemyLevel(int32_t baseLevel) {
    std::uniform_int_distribution<int32_t> delta(-1, 1);
    return std::max(baseLevel + delta(engine_), 1);
}

uint32_t DefaultRandomizer::Range(uint32_t n) {
    if (n == 0) {
        return 0;
    }
    std::uniform_int_distribution<uint32_t> dist(0, n - 1);
    return dist(engine_);
}

bool DefaultRandomizer::OneIn(uint32_t n) {
    return n > 0 && Range(n) == 0;
}

int32_t DefaultRandomizer::Damage(int32_t base) {
    return std::max(jitter(base, 0.2), 1);
}

bool DefaultRandomizer::IsCritical() {
    return OneIn(kCriticalOneIn);
}

bool DefaultRandomizer::IsMiss(int32_t attackerSpeed, int32_t defenderSpeed) {
    return roll(MissChance(attackerSpeed, defenderSpeed));
}

bool DefaultRandomizer::FleeSucceeds(int32_t playerSpeed, int32_t enemySpeed) {
    return roll(FleeChance(playerSpeed, enemySpeed));
}

bool DefaultRandomizer::BribeSucceeds(int32_t playerLevel, int32_t enemyLevel) {
    return roll(BribeChance(playerLevel, enemyLevel));
}

int32_t DefaultRandomizer::GoldGained(int32_t base) {
    return std::max(jitter(base, 0.2), 0);
}

int32_t DefaultRandomizer::XpGained(int32_t base) {
    return std::max(jitter(base, 0.2), 1);
}

// ── Internals ───────────────────────────────────────────────────────────

bool DefaultRandomizer::roll(double probability) {
    std::bernoulli_distribution dist(std::clamp(probability, 0.0, 1.0));
    return dist(engine_);
}

int32_t DefaultRandomizer::jitter(int32_t base, double spread) {
    std::uniform_real_distribution<double> factor(1.0 - spread, 1.0 + spread);
    return static_cast<int32_t>(std::lround(base * factor(engine_)));
}

}  // namespace dcr::game
