/// @file character.cpp
/// @brief Character progression, vitals, equipment and skills.

#include "dcr/game/character.hpp"

#include <algorithm>
#include <cmath>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;

Character::Character(Class cls, int32_t level)
    : class_(std::move(cls)), level_(std::max(level, 1)) {
    health_ = MaxHealth();
    mana_ = MaxMana();
}

int32_t Character::Strength() const noexcept {
    auto value = class_.strength.At(level_);
    return IsWearing(Ring::Ruby) ? value + value / 2 : value;
}

int32_t Character::Speed() const noexcept {
    auto value = class_.speed.At(level_);
    return IsWearing(Ring::Emerald) ? value + value / 2 : value;
}

// ── Progression ─────────────────────────────────────────────────────────

int32_t Character::XpForNext(int32_t level) noexcept {
    constexpr double kBaseXp = 30.0;
    constexpr double kExponent = 1.5;
    return static_cast<int32_t>(kBaseXp * std::pow(static_cast<double>(level), kExponent));
}

int32_t Character::AddExperience(int32_t xp) {
    if (xp <= 0) {
        return 0;
    }
    xp_ += xp;

    int32_t gained = 0;
    while (xp_ >= XpForNext()) {
        xp_ -= XpForNext();
        auto oldMaxHealth = MaxHealth();
        auto oldMaxMana = MaxMana();
        ++level_;
        ++gained;
        // Keep damage taken; current values grow with the maxima.
        health_ = std::min(health_ + (MaxHealth() - oldMaxHealth), MaxHealth());
        mana_ = std::min(mana_ + (MaxMana() - oldMaxMana), MaxMana());
    }
    if (gained > 0) {
        DCR_LOG_INFO(LogCategory::Character,
                     class_.name + " reached level " + std::to_string(level_));
    }
    return gained;
}

// ── Vitals ──────────────────────────────────────────────────────────────

bool Character::ReceiveDamage(int32_t amount) {
    health_ = std::max(health_ - std::max(amount, 0), 0);
    return IsDead();
}

int32_t Character::Heal(int32_t amount) {
    auto before = health_;
    health_ = std::clamp(health_ + std::max(amount, 0), 0, MaxHealth());
    return health_ - before;
}

void Character::RestoreFull() {
    health_ = MaxHealth();
    mana_ = MaxMana();
}

bool Character::SpendMana(int32_t amount) {
    if (amount > mana_) {
        return false;
    }
    mana_ -= amount;
    return true;
}

int32_t Character::RestoreMana(int32_t amount) {
    auto before = mana_;
    mana_ = std::clamp(mana_ + std::max(amount, 0), 0, MaxMana());
    return mana_ - before;
}

// ── Rings ───────────────────────────────────────────────────────────────

std::optional<Ring> Character::EquipRing(Ring ring) {
    auto evicted = rings_[1];
    rings_[1] = rings_[0];
    rings_[0] = ring;
    if (evicted) {
        DCR_LOG_DEBUG(LogCategory::Character,
                      "removed " + std::string(ringName(*evicted)) + " ring");
    }
    return evicted;
}

bool Character::UnequipRing(Ring ring) {
    if (rings_[0] == ring) {
        // The older ring stays; it moves to the newest slot.
        rings_[0] = rings_[1];
        rings_[1].reset();
        return true;
    }
    if (rings_[1] == ring) {
        rings_[1].reset();
        return true;
    }
    return false;
}

bool Character::IsWearing(Ring ring) const noexcept {
    return rings_[0] == ring || rings_[1] == ring;
}

// ── Status effect ───────────────────────────────────────────────────────

bool Character::CureStatus() noexcept {
    bool had = status_.has_value();
    status_.reset();
    return had;
}

// ── Skills ──────────────────────────────────────────────────────────────

GameResult<SkillId> Character::LearnSkill(std::string_view name) {
    const SkillDef* skill = FindSkill(name);
    if (!skill) {
        return fail<SkillId>(ErrorCode::UnknownSkill, "unknown skill: " + std::string(name));
    }
    if (KnowsSkill(skill->id)) {
        return fail<SkillId>(ErrorCode::SkillAlreadyLearned,
                             "skill already learned: " + std::string(name));
    }
    if (level_ < skill->minLevel) {
        return fail<SkillId>(ErrorCode::SkillPrerequisiteNotMet,
                             std::string(name) + " requires level " + std::to_string(skill->minLevel));
    }
    skills_.insert(skill->id);
    DCR_LOG_INFO(LogCategory::Character, class_.name + " learned " + std::string(name));
    return GameResult<SkillId>::ok(skill->id);
}

}  // namespace dcr::game
