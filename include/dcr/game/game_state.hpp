#pragma once

/// @file game_state.hpp
/// @brief The complete, copyable game state tree.
///
/// Snapshot and restore are plain copies; the persistence format is
/// left to the caller.

#include <cstdint>

#include "dcr/game/character.hpp"
#include "dcr/game/class_catalog.hpp"
#include "dcr/game/encounter_types.hpp"
#include "dcr/game/inventory.hpp"
#include "dcr/game/location.hpp"
#include "dcr/game/quest_system.hpp"
#include "dcr/game/tombstone_ledger.hpp"

namespace dcr::game {

struct GameState {
    Character player;
    int32_t gold = 0;
    Location location;
    EncounterSlot encounter;
    QuestSystem quests;
    TombstoneLedger tombstones;
    Inventory inventory;

    /// Level-1 hero of the first player class, at home, standard quests.
    [[nodiscard]] static GameState New(const ClassCatalog& catalog) {
        return GameState{Character(catalog.PlayerFirst(), 1), 0, Location::Home(),
                         EncounterSlot{}, QuestSystem::Standard(), TombstoneLedger{},
                         Inventory{}};
    }

    /// The enemy being fought, or nullptr.
    [[nodiscard]] Character* Enemy() {
        auto* combat = std::get_if<InCombat>(&encounter);
        return combat ? &combat->enemy : nullptr;
    }

    [[nodiscard]] const Character* Enemy() const {
        const auto* combat = std::get_if<InCombat>(&encounter);
        return combat ? &combat->enemy : nullptr;
    }

    [[nodiscard]] EncounterState Encounter() const noexcept { return StateOf(encounter); }

    void ClearEncounter() noexcept { encounter = std::monostate{}; }
};

}  // namespace dcr::game
