#pragma once

/// @file character.hpp
/// @brief Mutable hero or enemy: class snapshot, level, vitals, rings,
///        status effect and learned skills.

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "dcr/foundation/game_result.hpp"
#include "dcr/game/character_types.hpp"
#include "dcr/game/class_catalog.hpp"
#include "dcr/game/skill_types.hpp"

namespace dcr::game {

/// Two ring slots. Index 0 holds the newest ring, index 1 the oldest.
using RingSlots = std::array<std::optional<Ring>, 2>;

/// A character instance.
///
/// Invariants:
///   - level >= 1, xp >= 0
///   - 0 <= health <= MaxHealth(); health == 0 only transiently (death)
///   - at most one status effect
class Character {
public:
    Character(Class cls, int32_t level);

    // ── Identity / stats ───────────────────────────────────────────────

    [[nodiscard]] const Class& GetClass() const noexcept { return class_; }
    [[nodiscard]] const std::string& Name() const noexcept { return class_.name; }
    [[nodiscard]] int32_t Level() const noexcept { return level_; }
    [[nodiscard]] int32_t Xp() const noexcept { return xp_; }
    [[nodiscard]] int32_t Health() const noexcept { return health_; }
    [[nodiscard]] int32_t Mana() const noexcept { return mana_; }

    [[nodiscard]] int32_t MaxHealth() const noexcept { return class_.hp.At(level_); }
    [[nodiscard]] int32_t MaxMana() const noexcept { return class_.mp.At(level_); }

    /// Strength after ring bonuses.
    [[nodiscard]] int32_t Strength() const noexcept;

    /// Speed after ring bonuses.
    [[nodiscard]] int32_t Speed() const noexcept;

    [[nodiscard]] bool IsDead() const noexcept { return health_ <= 0; }

    // ── Progression ────────────────────────────────────────────────────

    /// Experience needed to reach the next level: floor(30 * L^1.5).
    [[nodiscard]] static int32_t XpForNext(int32_t level) noexcept;
    [[nodiscard]] int32_t XpForNext() const noexcept { return XpForNext(level_); }

    /// Accumulate experience, levelling up as thresholds are crossed.
    /// @return Number of levels gained.
    int32_t AddExperience(int32_t xp);

    // ── Vitals ─────────────────────────────────────────────────────────

    /// Lower health, saturating at zero.
    /// @return true if the character is now dead.
    bool ReceiveDamage(int32_t amount);

    /// Raise health up to the maximum. @return Amount actually healed.
    int32_t Heal(int32_t amount);

    /// Restore health and mana to their maxima.
    void RestoreFull();

    /// Spend mana. @return false (nothing spent) if not enough.
    bool SpendMana(int32_t amount);

    int32_t RestoreMana(int32_t amount);

    // ── Rings ──────────────────────────────────────────────────────────

    /// Equip a ring, evicting the one worn longest when both slots are full.
    /// @return The evicted ring, if any.
    std::optional<Ring> EquipRing(Ring ring);

    /// Remove a worn ring. @return false if it was not worn.
    bool UnequipRing(Ring ring);

    [[nodiscard]] const RingSlots& Rings() const noexcept { return rings_; }

    [[nodiscard]] bool IsWearing(Ring ring) const noexcept;

    /// Evade ring in either slot; derived from the slots on every call.
    [[nodiscard]] bool EnemiesEvaded() const noexcept { return IsWearing(Ring::Evade); }

    // ── Status effect ──────────────────────────────────────────────────

    [[nodiscard]] const std::optional<StatusEffect>& Status() const noexcept { return status_; }

    /// Replace any current status effect.
    void Afflict(StatusEffect effect) noexcept { status_ = effect; }

    /// @return true if an effect was removed.
    bool CureStatus() noexcept;

    // ── Skills ─────────────────────────────────────────────────────────

    /// Learn a skill by name.
    ///
    /// Errors: UnknownSkill, SkillAlreadyLearned, SkillPrerequisiteNotMet.
    foundation::GameResult<SkillId> LearnSkill(std::string_view name);

    [[nodiscard]] bool KnowsSkill(SkillId id) const { return skills_.contains(id); }
    [[nodiscard]] const std::set<SkillId>& Skills() const noexcept { return skills_; }

private:
    Class class_;
    int32_t level_ = 1;
    int32_t xp_ = 0;
    int32_t health_ = 0;
    int32_t mana_ = 0;
    RingSlots rings_{};
    std::optional<StatusEffect> status_;
    std::set<SkillId> skills_;
};

}  // namespace dcr::game
