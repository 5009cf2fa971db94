#pragma once

/// @file quest_system.hpp
/// @brief QuestSystem: broadcasts gameplay events to registered quests.
///
/// Quests are registered once at game initialization and never removed.
/// Dispatch delivers an event to every quest that is not yet complete,
/// in registration order; completed quests are skipped for good.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "dcr/game/quest_types.hpp"

namespace dcr::game {

/// A quest that a dispatch just completed.
struct QuestCompletion {
    std::string description;
    int32_t reward = 0;
};

class QuestSystem {
public:
    /// The quests every new game starts with.
    [[nodiscard]] static QuestSystem Standard();

    /// Append a quest. Descriptions are the lookup key.
    void Register(Quest quest);

    /// Deliver @p event to every active quest.
    /// @return Quests completed by this event, in registration order.
    std::vector<QuestCompletion> Dispatch(const Event& event);

    /// Registered and not yet completed.
    [[nodiscard]] bool IsActive(std::string_view description) const;

    [[nodiscard]] const Quest* Find(std::string_view description) const;

    [[nodiscard]] const std::vector<Quest>& Quests() const noexcept { return quests_; }

    [[nodiscard]] std::size_t CompletedCount() const;

private:
    std::vector<Quest> quests_;
};

}  // namespace dcr::game
