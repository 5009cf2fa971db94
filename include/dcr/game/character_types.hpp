#pragma once

/// @file character_types.hpp
/// @brief Enumerations shared by classes, characters and items.

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dcr::game {

/// Class rank. Player classes are selectable; the others are enemy tiers.
enum class Category : uint8_t {
    Player,
    Common,
    Rare,
    Legendary,
    Boss   ///< Narrative-only enemies, never picked by the random spawner.
};

constexpr std::string_view categoryName(Category category) {
    switch (category) {
        case Category::Player:    return "player";
        case Category::Common:    return "common";
        case Category::Rare:      return "rare";
        case Category::Legendary: return "legendary";
        case Category::Boss:      return "boss";
    }
    return "unknown";
}

constexpr std::optional<Category> parseCategory(std::string_view name) {
    constexpr std::array<Category, 5> all = {
        Category::Player, Category::Common, Category::Rare,
        Category::Legendary, Category::Boss};
    for (auto category : all) {
        if (categoryName(category) == name) { return category; }
    }
    return std::nullopt;
}

/// Minimum player level at which the random spawner may pick a tier.
constexpr int32_t categoryLevelRequirement(Category category) {
    switch (category) {
        case Category::Common:    return 1;
        case Category::Rare:      return 5;
        case Category::Legendary: return 10;
        default:                  return 1;
    }
}

/// Reward and bribe multiplier for a tier.
constexpr int32_t categoryMultiplier(Category category) {
    switch (category) {
        case Category::Rare:      return 2;
        case Category::Legendary:
        case Category::Boss:      return 3;
        default:                  return 1;
    }
}

/// Ongoing condition ticking on every location change.
enum class StatusEffect : uint8_t {
    Burn,
    Poison
};

constexpr std::string_view statusEffectName(StatusEffect effect) {
    switch (effect) {
        case StatusEffect::Burn:   return "burn";
        case StatusEffect::Poison: return "poison";
    }
    return "unknown";
}

constexpr std::optional<StatusEffect> parseStatusEffect(std::string_view name) {
    if (name == "burn") { return StatusEffect::Burn; }
    if (name == "poison") { return StatusEffect::Poison; }
    return std::nullopt;
}

/// Equippable rings. Two slots, first-in first-out.
enum class Ring : uint8_t {
    Void,     ///< No effect.
    Evade,    ///< Suppresses enemy spawns.
    Ruling,   ///< Lures the final boss.
    Ruby,     ///< +50% strength.
    Emerald   ///< +50% speed.
};

constexpr std::string_view ringName(Ring ring) {
    switch (ring) {
        case Ring::Void:    return "void";
        case Ring::Evade:   return "evade";
        case Ring::Ruling:  return "ruling";
        case Ring::Ruby:    return "ruby";
        case Ring::Emerald: return "emerald";
    }
    return "unknown";
}

/// Inventory item keys.
enum class ItemKey : uint8_t {
    Potion,
    Remedy,
    Ether,
    Amulet
};

constexpr std::string_view itemName(ItemKey key) {
    switch (key) {
        case ItemKey::Potion: return "potion";
        case ItemKey::Remedy: return "remedy";
        case ItemKey::Ether:  return "ether";
        case ItemKey::Amulet: return "amulet";
    }
    return "unknown";
}

}  // namespace dcr::game
