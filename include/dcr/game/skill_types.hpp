#pragma once

/// @file skill_types.hpp
/// @brief Closed table of learnable skills.

#include <array>
#include <cstdint>
#include <string_view>

namespace dcr::game {

enum class SkillId : uint8_t {
    PowerStrike,
    Cleanse,
    Heal,
    Fireball
};

/// Offensive skills need an enemy; support skills work anywhere.
enum class SkillKind : uint8_t {
    Offensive,
    Support
};

struct SkillDef {
    SkillId id;
    std::string_view name;
    SkillKind kind;
    int32_t minLevel;
    int32_t manaCost;
    int32_t strengthMultiplier;  ///< Offensive only.
    bool neverMisses;
};

inline constexpr std::array<SkillDef, 4> kSkills = {{
    {SkillId::PowerStrike, "strike",   SkillKind::Offensive, 1, 4,  2, false},
    {SkillId::Cleanse,     "cleanse",  SkillKind::Support,   2, 5,  0, false},
    {SkillId::Heal,        "heal",     SkillKind::Support,   3, 8,  0, false},
    {SkillId::Fireball,    "fireball", SkillKind::Offensive, 5, 12, 3, true},
}};

/// Lookup by name; nullptr for unknown skills.
constexpr const SkillDef* FindSkill(std::string_view name) {
    for (const auto& skill : kSkills) {
        if (skill.name == name) { return &skill; }
    }
    return nullptr;
}

constexpr const SkillDef& GetSkill(SkillId id) {
    return kSkills[static_cast<std::size_t>(id)];
}

}  // namespace dcr::game
