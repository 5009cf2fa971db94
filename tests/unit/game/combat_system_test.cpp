#include <gtest/gtest.h>

#include "dcr/game/combat_system.hpp"

#include "support/game_fixture.hpp"

using namespace dcr::foundation;
using namespace dcr::game;

class CombatSystemTest : public dcr::test::GameFixture {
protected:
    void SetHero(int32_t level) {
        state_.player = Character(*catalog_.Find("warrior"), level);
    }

    CombatSystem combat_{ctx_};
};

// =============================================================================
// Formulas
// =============================================================================

TEST(CombatFormulaTest, DamageHasFloorAndCriticalDoubles) {
    EXPECT_EQ(CombatSystem::CalculateDamage(0, false), 1);
    EXPECT_EQ(CombatSystem::CalculateDamage(7, false), 7);
    EXPECT_EQ(CombatSystem::CalculateDamage(7, true), 14);
}

TEST_F(CombatSystemTest, BribeCostScalesWithLevelAndTier) {
    EXPECT_EQ(CombatSystem::BribeCost(Character(*catalog_.Find("goblin"), 2), rules_), 100);
    EXPECT_EQ(CombatSystem::BribeCost(Character(*catalog_.Find("goblin shaman"), 3), rules_),
              300);
    EXPECT_EQ(CombatSystem::BribeCost(Character(*catalog_.Find("goblin warlord"), 1), rules_),
              150);
}

TEST_F(CombatSystemTest, ExperienceFavorsStrongerEnemies) {
    SetHero(5);
    const Class& goblin = *catalog_.Find("goblin");
    EXPECT_EQ(CombatSystem::BaseExperience(state_.player, Character(goblin, 5), rules_), 100);
    EXPECT_EQ(CombatSystem::BaseExperience(state_.player, Character(goblin, 7), rules_), 300);
    EXPECT_EQ(CombatSystem::BaseExperience(state_.player, Character(goblin, 3), rules_), 33);

    const Class& shaman = *catalog_.Find("goblin shaman");
    EXPECT_EQ(CombatSystem::BaseExperience(state_.player, Character(shaman, 5), rules_), 200);
}

// =============================================================================
// Attack
// =============================================================================

TEST_F(CombatSystemTest, AttackWithoutEnemyIsInvalidAction) {
    auto before = state_.player.Health();
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidAction);
    EXPECT_EQ(state_.player.Health(), before);
}

TEST_F(CombatSystemTest, AttackExchangesBlows) {
    Engage("goblin", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());

    const auto& report = result.value();
    EXPECT_EQ(report.outcome, CombatOutcome::Continue);
    ASSERT_TRUE(report.playerHit.has_value());
    EXPECT_EQ(report.playerHit->damage, 10);
    ASSERT_TRUE(report.enemyHit.has_value());
    EXPECT_EQ(report.enemyHit->damage, 5);
    EXPECT_EQ(state_.Enemy()->Health(), 10);
    EXPECT_EQ(state_.player.Health(), 45);
}

TEST_F(CombatSystemTest, KillingBlowGrantsRewards) {
    Engage("rat", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());

    const auto& report = result.value();
    EXPECT_EQ(report.outcome, CombatOutcome::Victory);
    EXPECT_FALSE(report.enemyHit.has_value());
    EXPECT_EQ(report.xpGained, 100);
    EXPECT_EQ(report.goldGained, 50);
    EXPECT_EQ(report.levelsGained, 1);
    EXPECT_EQ(state_.gold, 50);
    EXPECT_EQ(state_.player.Level(), 2);
    EXPECT_EQ(state_.Encounter(), EncounterState::Idle);

    ASSERT_EQ(report.events.size(), 2u);
    const auto* won = std::get_if<BattleWon>(&report.events[0]);
    ASSERT_NE(won, nullptr);
    EXPECT_EQ(won->enemyName, "rat");
    const auto* levelUp = std::get_if<LevelUp>(&report.events[1]);
    ASSERT_NE(levelUp, nullptr);
    EXPECT_EQ(levelUp->level, 2);
}

TEST_F(CombatSystemTest, CriticalHitDoublesDamage) {
    random_.critical = true;
    Engage("goblin", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().playerHit->critical);
    EXPECT_EQ(result.value().playerHit->damage, 20);
    EXPECT_EQ(result.value().outcome, CombatOutcome::Victory);
}

TEST_F(CombatSystemTest, MissDealsNoDamage) {
    random_.miss = true;
    Engage("goblin", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().playerHit->missed);
    EXPECT_EQ(result.value().playerHit->damage, 0);
    EXPECT_EQ(state_.Enemy()->Health(), state_.Enemy()->MaxHealth());
}

TEST_F(CombatSystemTest, GuardianDropsAmulet) {
    Engage("guardian", 1);
    state_.Enemy()->ReceiveDamage(95);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());

    const auto& report = result.value();
    EXPECT_EQ(report.outcome, CombatOutcome::Victory);
    ASSERT_TRUE(report.loot.has_value());
    EXPECT_EQ(*report.loot, ItemKey::Amulet);
    EXPECT_EQ(state_.inventory.Count(ItemKey::Amulet), 1);
    EXPECT_EQ(report.xpGained, 300);

    bool amuletEvent = false;
    for (const auto& event : report.events) {
        if (const auto* added = std::get_if<ItemAdded>(&event)) {
            amuletEvent = added->item == ItemKey::Amulet;
        }
    }
    EXPECT_TRUE(amuletEvent);
}

TEST_F(CombatSystemTest, EnemyMayInflictStatus) {
    random_.oneIns = {true};
    Engage("imp", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());
    ASSERT_TRUE(result.value().inflicted.has_value());
    EXPECT_EQ(*result.value().inflicted, StatusEffect::Burn);
    ASSERT_TRUE(state_.player.Status().has_value());
    EXPECT_EQ(*state_.player.Status(), StatusEffect::Burn);
}

TEST_F(CombatSystemTest, NoInflictionWhenRollFails) {
    random_.oneIns = {false};
    Engage("imp", 1);
    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().inflicted.has_value());
    EXPECT_FALSE(state_.player.Status().has_value());
}

// =============================================================================
// Death
// =============================================================================

TEST_F(CombatSystemTest, LethalRetaliationSettlesDeath) {
    state_.location = Location("~/cave", Distance(4));
    state_.gold = 120;
    state_.player.AddExperience(10);
    state_.player.ReceiveDamage(47);
    Engage("goblin", 1);

    auto result = combat_.Attack(state_);
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(result.error().isDeath());
    const auto* tombstone = result.error().context<Tombstone>();
    ASSERT_NE(tombstone, nullptr);
    EXPECT_EQ(tombstone->location, "~/cave");
    EXPECT_EQ(tombstone->gold, 120);

    EXPECT_EQ(state_.gold, 0);
    EXPECT_EQ(state_.player.Xp(), 0);
    EXPECT_EQ(state_.player.Level(), 1);
    EXPECT_EQ(state_.player.Health(), state_.player.MaxHealth());
    EXPECT_EQ(state_.Encounter(), EncounterState::Idle);
    ASSERT_EQ(state_.tombstones.Size(), 1u);
    EXPECT_TRUE(state_.tombstones.HasAt("~/cave"));
}

// =============================================================================
// Flee
// =============================================================================

TEST_F(CombatSystemTest, SuccessfulFleeDisengages) {
    Engage("goblin", 1);
    auto result = combat_.Flee(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, CombatOutcome::Disengaged);
    EXPECT_FALSE(result.value().enemyHit.has_value());
    EXPECT_EQ(result.value().xpGained, 0);
    EXPECT_EQ(state_.Encounter(), EncounterState::Idle);
}

TEST_F(CombatSystemTest, FailedFleeDrawsRetaliation) {
    random_.flee = false;
    Engage("goblin", 1);
    auto result = combat_.Flee(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, CombatOutcome::Continue);
    ASSERT_TRUE(result.value().enemyHit.has_value());
    EXPECT_EQ(state_.player.Health(), 45);
    EXPECT_EQ(state_.Encounter(), EncounterState::InCombat);
}

TEST_F(CombatSystemTest, FleeWithoutEnemyIsInvalidAction) {
    auto result = combat_.Flee(state_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidAction);
}

// =============================================================================
// Bribe
// =============================================================================

TEST_F(CombatSystemTest, BribeWithoutEnemyIsInvalidAction) {
    state_.gold = 1000;
    auto result = combat_.Bribe(state_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidAction);
    EXPECT_EQ(state_.gold, 1000);
}

TEST_F(CombatSystemTest, BribeWithoutEnoughGoldChangesNothing) {
    state_.gold = 80;
    Engage("goblin", 2);
    auto hp = state_.player.Health();

    auto result = combat_.Bribe(state_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientGold);
    EXPECT_EQ(state_.gold, 80);
    EXPECT_EQ(state_.player.Health(), hp);
    EXPECT_EQ(state_.Encounter(), EncounterState::InCombat);
}

TEST_F(CombatSystemTest, AcceptedBribeCostsGold) {
    state_.gold = 150;
    Engage("goblin", 2);
    auto result = combat_.Bribe(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, CombatOutcome::Disengaged);
    EXPECT_EQ(result.value().goldSpent, 100);
    EXPECT_EQ(state_.gold, 50);
    EXPECT_EQ(state_.Encounter(), EncounterState::Idle);
}

TEST_F(CombatSystemTest, RefusedBribeKeepsGoldAndDrawsRetaliation) {
    random_.bribe = false;
    state_.gold = 150;
    Engage("goblin", 2);
    auto result = combat_.Bribe(state_);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, CombatOutcome::Continue);
    EXPECT_EQ(result.value().goldSpent, 0);
    EXPECT_TRUE(result.value().enemyHit.has_value());
    EXPECT_EQ(state_.gold, 150);
    EXPECT_EQ(state_.Encounter(), EncounterState::InCombat);
}

// =============================================================================
// Skills
// =============================================================================

TEST_F(CombatSystemTest, SkillErrorsAreCheckedInOrder) {
    auto unknown = combat_.UseSkill(state_, "meteor");
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownSkill);

    auto notLearned = combat_.UseSkill(state_, "strike");
    ASSERT_TRUE(notLearned.hasError());
    EXPECT_EQ(notLearned.error().code(), ErrorCode::SkillNotLearned);

    ASSERT_TRUE(state_.player.LearnSkill("strike").hasValue());
    auto noTarget = combat_.UseSkill(state_, "strike");
    ASSERT_TRUE(noTarget.hasError());
    EXPECT_EQ(noTarget.error().code(), ErrorCode::InvalidAction);
    EXPECT_EQ(state_.player.Mana(), state_.player.MaxMana());

    Engage("goblin", 1);
    ASSERT_TRUE(state_.player.SpendMana(state_.player.Mana()));
    auto noMana = combat_.UseSkill(state_, "strike");
    ASSERT_TRUE(noMana.hasError());
    EXPECT_EQ(noMana.error().code(), ErrorCode::InsufficientResources);
    EXPECT_EQ(state_.Enemy()->Health(), state_.Enemy()->MaxHealth());
}

TEST_F(CombatSystemTest, PowerStrikeHitsTwiceAsHard) {
    ASSERT_TRUE(state_.player.LearnSkill("strike").hasValue());
    Engage("goblin", 1);
    auto result = combat_.UseSkill(state_, "strike");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().playerHit->damage, 20);
    EXPECT_EQ(result.value().outcome, CombatOutcome::Victory);
    EXPECT_EQ(state_.player.Mana(), 16);
}

TEST_F(CombatSystemTest, FireballNeverMisses) {
    SetHero(5);
    ASSERT_TRUE(state_.player.LearnSkill("fireball").hasValue());
    random_.miss = true;
    Engage("goblin", 5);

    auto result = combat_.UseSkill(state_, "fireball");
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().playerHit->missed);
    EXPECT_EQ(result.value().playerHit->damage, 54);
    EXPECT_EQ(result.value().outcome, CombatOutcome::Victory);
}

TEST_F(CombatSystemTest, HealOutsideCombat) {
    SetHero(3);
    ASSERT_TRUE(state_.player.LearnSkill("heal").hasValue());
    state_.player.ReceiveDamage(30);

    auto result = combat_.UseSkill(state_, "heal");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, CombatOutcome::Continue);
    EXPECT_EQ(result.value().healed, 30);
    EXPECT_FALSE(result.value().enemyHit.has_value());
    EXPECT_EQ(state_.player.Health(), state_.player.MaxHealth());
    EXPECT_EQ(state_.player.Mana(), state_.player.MaxMana() - 8);
}

TEST_F(CombatSystemTest, CleanseInCombatGivesEnemyATurn) {
    SetHero(2);
    ASSERT_TRUE(state_.player.LearnSkill("cleanse").hasValue());
    state_.player.Afflict(StatusEffect::Poison);
    Engage("goblin", 1);

    auto result = combat_.UseSkill(state_, "cleanse");
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(state_.player.Status().has_value());
    EXPECT_FALSE(result.value().playerHit.has_value());
    EXPECT_TRUE(result.value().enemyHit.has_value());
}
