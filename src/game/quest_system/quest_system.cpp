/// @file quest_system.cpp
/// @brief Quest kinds and QuestSystem dispatch.

#include "dcr/game/quest_system.hpp"

#include <algorithm>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::LogCategory;

// ── Quest kinds ─────────────────────────────────────────────────────────

bool WinBattles::Handle(const Event& event) {
    if (std::holds_alternative<BattleWon>(event)) {
        won = std::min(won + 1, required);
    }
    return won >= required;
}

bool ReachLevel::Handle(const Event& event) const {
    return std::visit(Overloaded{
        [this](const LevelUp& e) { return e.level >= target; },
        [](const auto&) { return false; },
    }, event);
}

bool VisitTombstone::Handle(const Event& event) const {
    return std::holds_alternative<TombstoneFound>(event);
}

bool DefeatGuardian::Handle(const Event& event) const {
    return std::visit(Overloaded{
        [](const BattleWon& e) { return e.enemyName == kEnemyName; },
        [](const auto&) { return false; },
    }, event);
}

bool FindAmulet::Handle(const Event& event) const {
    return std::visit(Overloaded{
        [](const ItemAdded& e) { return e.item == ItemKey::Amulet; },
        [](const auto&) { return false; },
    }, event);
}

bool Quest::Handle(const Event& event) {
    if (completed) {
        return true;
    }
    completed = std::visit([&event](auto& kind) { return kind.Handle(event); }, kind);
    return completed;
}

// ── QuestSystem ─────────────────────────────────────────────────────────

QuestSystem QuestSystem::Standard() {
    QuestSystem quests;
    quests.Register({"Win your first battle.", WinBattles{1, 0}, 100});
    quests.Register({"Reach level 5.", ReachLevel{5}, 200});
    quests.Register({"Visit a fallen hero's tombstone.", VisitTombstone{}, 200});
    quests.Register({std::string(kGuardianQuestDescription), DefeatGuardian{}, 1000});
    quests.Register({"Find the Amulet of Power.", FindAmulet{}, 500});
    return quests;
}

void QuestSystem::Register(Quest quest) {
    if (Find(quest.description) != nullptr) {
        DCR_LOG_WARN(LogCategory::Quest, "ignoring duplicate quest: " + quest.description);
        return;
    }
    quests_.push_back(std::move(quest));
}

std::vector<QuestCompletion> QuestSystem::Dispatch(const Event& event) {
    std::vector<QuestCompletion> completed;
    for (auto& quest : quests_) {
        if (quest.completed) {
            continue;
        }
        if (quest.Handle(event)) {
            DCR_LOG_INFO(LogCategory::Quest, "quest completed: " + quest.description);
            completed.push_back({quest.description, quest.reward});
        }
    }
    return completed;
}

bool QuestSystem::IsActive(std::string_view description) const {
    const Quest* quest = Find(description);
    return quest != nullptr && !quest->completed;
}

const Quest* QuestSystem::Find(std::string_view description) const {
    auto it = std::find_if(quests_.begin(), quests_.end(),
                           [description](const Quest& q) { return q.description == description; });
    return it != quests_.end() ? &(*it) : nullptr;
}

std::size_t QuestSystem::CompletedCount() const {
    return static_cast<std::size_t>(
        std::count_if(quests_.begin(), quests_.end(),
                      [](const Quest& q) { return q.completed; }));
}

}  // namespace dcr::game
