#pragma once

/// @file encounter_types.hpp
/// @brief The single, mutually exclusive encounter slot of a game.

#include <cstdint>
#include <string_view>
#include <variant>

#include "dcr/game/character.hpp"
#include "dcr/game/class_catalog.hpp"

namespace dcr::game {

/// Non-hostile characters met on the road.
enum class NpcKind : uint8_t {
    Gambler,        ///< Answers to Bet.
    Witch,          ///< Answers to Brew.
    GhostlyMaiden   ///< Answers to Listen.
};

inline constexpr uint32_t kNpcKindCount = 3;

constexpr std::string_view npcKindName(NpcKind kind) {
    switch (kind) {
        case NpcKind::Gambler:       return "gambler";
        case NpcKind::Witch:         return "witch";
        case NpcKind::GhostlyMaiden: return "ghostly maiden";
    }
    return "unknown";
}

/// Slot payload while fighting.
struct InCombat {
    Character enemy;
};

/// Slot payload while an NPC waits for its verb.
struct InNpcEncounter {
    NpcKind kind = NpcKind::Gambler;
};

/// none | in-combat(enemy) | in-npc-encounter(kind)
using EncounterSlot = std::variant<std::monostate, InCombat, InNpcEncounter>;

/// Encounter state machine states.
///
/// Idle -> InCombat        (enemy spawn)
/// Idle -> InNpcEncounter  (NPC roll, only when no enemy spawned)
/// InCombat -> Idle        (victory, flee, bribe, death)
/// InNpcEncounter -> Idle  (the NPC's single verb)
enum class EncounterState : uint8_t {
    Idle,
    InCombat,
    InNpcEncounter
};

constexpr EncounterState StateOf(const EncounterSlot& slot) noexcept {
    if (std::holds_alternative<InCombat>(slot)) { return EncounterState::InCombat; }
    if (std::holds_alternative<InNpcEncounter>(slot)) { return EncounterState::InNpcEncounter; }
    return EncounterState::Idle;
}

/// Class and level for an enemy about to be instantiated.
struct SpawnSpec {
    Class cls;
    int32_t level = 1;
};

}  // namespace dcr::game
