#pragma once

/// @file inventory.hpp
/// @brief Item counts carried by the hero.

#include <cstdint>
#include <map>

#include "dcr/game/character_types.hpp"

namespace dcr::game {

/// Stackable item storage keyed by ItemKey.
class Inventory {
public:
    void Add(ItemKey key, int32_t count = 1) {
        if (count > 0) {
            items_[key] += count;
        }
    }

    /// Remove one item. @return false if none was carried.
    bool Remove(ItemKey key) {
        auto it = items_.find(key);
        if (it == items_.end()) {
            return false;
        }
        if (--it->second == 0) {
            items_.erase(it);
        }
        return true;
    }

    [[nodiscard]] int32_t Count(ItemKey key) const {
        auto it = items_.find(key);
        return it != items_.end() ? it->second : 0;
    }

    [[nodiscard]] bool Empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const std::map<ItemKey, int32_t>& Items() const noexcept { return items_; }

private:
    std::map<ItemKey, int32_t> items_;
};

}  // namespace dcr::game
