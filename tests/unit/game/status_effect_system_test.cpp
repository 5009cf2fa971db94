#include <gtest/gtest.h>

#include "dcr/game/status_effect_system.hpp"

#include "support/game_fixture.hpp"

using namespace dcr::game;

class StatusEffectSystemTest : public dcr::test::GameFixture {
protected:
    StatusEffectSystem status_{ctx_};
};

TEST_F(StatusEffectSystemTest, TickDamageByEffect) {
    EXPECT_EQ(StatusEffectSystem::TickDamage(StatusEffect::Burn, 100, rules_), 5);
    EXPECT_EQ(StatusEffectSystem::TickDamage(StatusEffect::Poison, 100, rules_), 10);
    EXPECT_EQ(StatusEffectSystem::TickDamage(StatusEffect::Burn, 10, rules_), 1);
}

TEST_F(StatusEffectSystemTest, NoEffectNoTick) {
    auto before = state_.player.Health();
    EXPECT_FALSE(status_.Apply(state_.player).has_value());
    EXPECT_EQ(state_.player.Health(), before);
}

TEST_F(StatusEffectSystemTest, BurnTicksAndPersists) {
    state_.player.Afflict(StatusEffect::Burn);
    auto tick = status_.Apply(state_.player);
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->effect, StatusEffect::Burn);
    EXPECT_EQ(tick->damage, 2);
    EXPECT_FALSE(tick->lethal);
    EXPECT_EQ(state_.player.Health(), 48);

    ASSERT_TRUE(status_.Apply(state_.player).has_value());
    EXPECT_EQ(state_.player.Health(), 46);
    EXPECT_TRUE(state_.player.Status().has_value());
}

TEST_F(StatusEffectSystemTest, PoisonCanBeLethal) {
    state_.player.Afflict(StatusEffect::Poison);
    state_.player.ReceiveDamage(46);
    auto tick = status_.Apply(state_.player);
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->damage, 5);
    EXPECT_TRUE(tick->lethal);
    EXPECT_TRUE(state_.player.IsDead());
}

TEST_F(StatusEffectSystemTest, DivisorsComeFromRules) {
    rules_.burnDivisor = 5;
    state_.player.Afflict(StatusEffect::Burn);
    auto tick = status_.Apply(state_.player);
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->damage, 10);
}
