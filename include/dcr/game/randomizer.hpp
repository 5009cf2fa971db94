#pragma once

/// @file randomizer.hpp
/// @brief Pluggable source of every probabilistic decision in the game.
///
/// All systems receive an IRandomizer through the GameContext, so tests
/// can substitute a scripted implementation and make outcomes exact.

#include <cstdint>
#include <random>

#include "dcr/game/game_rules.hpp"
#include "dcr/game/location.hpp"

namespace dcr::game {

/// Randomness capability set.
///
/// Contract:
///   - ShouldEnemyAppear is non-decreasing in distance.
///   - EnemyLevel never returns a level below 1.
///   - Range(n) returns a value in [0, n) and 0 when n == 0.
///   - No method blocks; no state is kept across calls beyond the engine.
class IRandomizer {
public:
    virtual ~IRandomizer() = default;

    virtual bool ShouldEnemyAppear(Distance distance) = 0;

    /// Bounded jitter around @p baseLevel, never below 1.
    virtual int32_t EnemyLevel(int32_t baseLevel) = 0;

    /// Uniform integer in [0, n).
    virtual uint32_t Range(uint32_t n) = 0;

    /// True with probability 1/n.
    virtual bool OneIn(uint32_t n) = 0;

    /// Jittered hit damage around @p base.
    virtual int32_t Damage(int32_t base) = 0;

    virtual bool IsCritical() = 0;

    /// Miss chance is positive only when the defender is faster.
    virtual bool IsMiss(int32_t attackerSpeed, int32_t defenderSpeed) = 0;

    virtual bool FleeSucceeds(int32_t playerSpeed, int32_t enemySpeed) = 0;

    virtual bool BribeSucceeds(int32_t playerLevel, int32_t enemyLevel) = 0;

    virtual int32_t GoldGained(int32_t base) = 0;

    virtual int32_t XpGained(int32_t base) = 0;
};

/// Production randomizer backed by a seeded Mersenne Twister.
class DefaultRandomizer final : public IRandomizer {
public:
    /// Critical hits happen once in this many hits.
    static constexpr uint32_t kCriticalOneIn = 20;

    explicit DefaultRandomizer(const GameRules& rules);
    DefaultRandomizer(const GameRules& rules, uint64_t seed);

    bool ShouldEnemyAppear(Distance distance) override;
    int32_t EnemyLevel(int32_t baseLevel) override;
    uint32_t Range(uint32_t n) override;
    bool OneIn(uint32_t n) override;
    int32_t Damage(int32_t base) override;
    bool IsCritical() override;
    bool IsMiss(int32_t attackerSpeed, int32_t defenderSpeed) override;
    bool FleeSucceeds(int32_t playerSpeed, int32_t enemySpeed) override;
    bool BribeSucceeds(int32_t playerLevel, int32_t enemyLevel) override;
    int32_t GoldGained(int32_t base) override;
    int32_t XpGained(int32_t base) override;

    /// Probability used by ShouldEnemyAppear.
    [[nodiscard]] static double EncounterChance(const GameRules& rules, Distance distance);

    /// clamp(0.5 + (ps - es) / (2 * max(ps, es)), 0.1, 0.9)
    [[nodiscard]] static double FleeChance(int32_t playerSpeed, int32_t enemySpeed);

    /// clamp(0.75 - 0.05 * (enemyLevel - playerLevel), 0.1, 0.95)
    [[nodiscard]] static double BribeChance(int32_t playerLevel, int32_t enemyLevel);

    /// Chance that an attack misses; zero unless the defender is faster.
    [[nodiscard]] static double MissChance(int32_t attackerSpeed, int32_t defenderSpeed);

private:
    bool roll(double probability);
    int32_t jitter(int32_t base, double spread);

    const GameRules& rules_;
    std::mt19937_64 engine_;
};

}  // namespace dcr::game
