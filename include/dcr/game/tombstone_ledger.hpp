#pragma once

/// @file tombstone_ledger.hpp
/// @brief World record of fallen heroes and the gold they dropped.

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace dcr::game {

/// Created once per death, consumed on the first inspection of its location.
struct Tombstone {
    std::string location;
    int32_t gold = 0;
};

/// All tombstones currently lying in the world.
class TombstoneLedger {
public:
    void Add(Tombstone tombstone) { tombstones_.push_back(std::move(tombstone)); }

    /// Remove and return every tombstone at @p location.
    std::vector<Tombstone> TakeAt(const std::string& location) {
        std::vector<Tombstone> taken;
        auto it = std::stable_partition(tombstones_.begin(), tombstones_.end(),
                                        [&location](const Tombstone& t) {
                                            return t.location != location;
                                        });
        taken.assign(std::make_move_iterator(it), std::make_move_iterator(tombstones_.end()));
        tombstones_.erase(it, tombstones_.end());
        return taken;
    }

    [[nodiscard]] bool HasAt(const std::string& location) const {
        return std::any_of(tombstones_.begin(), tombstones_.end(),
                           [&location](const Tombstone& t) { return t.location == location; });
    }

    [[nodiscard]] std::size_t Size() const noexcept { return tombstones_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return tombstones_.empty(); }
    [[nodiscard]] const std::vector<Tombstone>& All() const noexcept { return tombstones_; }

private:
    std::vector<Tombstone> tombstones_;
};

}  // namespace dcr::game
