#pragma once

/// @file quest_types.hpp
/// @brief Gameplay events and the closed set of quest kinds.
///
/// Events are produced by combat, items and the tombstone ledger and
/// consumed only by quests. Each quest kind inspects events through
/// std::visit, so adding an event or a kind is checked at compile time.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "dcr/game/character_types.hpp"

namespace dcr::game {

// ── Events ──────────────────────────────────────────────────────────────

struct BattleWon {
    std::string enemyName;
    int32_t enemyLevel = 1;
    Category category = Category::Common;
};

struct LevelUp {
    int32_t level = 1;
};

struct ItemAdded {
    ItemKey item = ItemKey::Potion;
};

struct TombstoneFound {
    int32_t gold = 0;
};

using Event = std::variant<BattleWon, LevelUp, ItemAdded, TombstoneFound>;

/// Helper for building std::visit overload sets.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// ── Quest kinds ─────────────────────────────────────────────────────────

/// Win a number of battles.
struct WinBattles {
    int32_t required = 1;
    int32_t won = 0;

    bool Handle(const Event& event);
};

/// Reach a character level.
struct ReachLevel {
    int32_t target = 5;

    bool Handle(const Event& event) const;
};

/// Pick up any tombstone.
struct VisitTombstone {
    bool Handle(const Event& event) const;
};

/// Beat the guardian boss.
struct DefeatGuardian {
    static constexpr std::string_view kEnemyName = "guardian";

    bool Handle(const Event& event) const;
};

/// Obtain the amulet.
struct FindAmulet {
    bool Handle(const Event& event) const;
};

using QuestKind = std::variant<WinBattles, ReachLevel, VisitTombstone, DefeatGuardian, FindAmulet>;

/// Description of the boss quest; the encounter generator keys on it.
inline constexpr std::string_view kGuardianQuestDescription = "Defeat the Guardian.";

/// A quest instance. Once completed it never reverts.
struct Quest {
    std::string description;
    QuestKind kind;
    int32_t reward = 0;
    bool completed = false;

    /// Feed an event. @return completion status after the event.
    bool Handle(const Event& event);
};

}  // namespace dcr::game
