#pragma once

/// @file location.hpp
/// @brief Location facts consumed from the external location module.
///
/// Translating real filesystem paths into these values is not done here;
/// the caller builds Location values and the engine only reads them.

#include <compare>
#include <cstdint>
#include <string>
#include <utility>

namespace dcr::game {

/// Coarse classification of a Distance.
enum class DistanceBand : uint8_t {
    Near,  ///< len <= kNearLimit
    Mid,   ///< len <= kMidLimit
    Far    ///< anything further
};

/// Opaque, totally ordered remoteness from the home location.
class Distance {
public:
    static constexpr int32_t kNearLimit = 5;
    static constexpr int32_t kMidLimit = 10;

    constexpr Distance() = default;
    constexpr explicit Distance(int32_t len) : len_(len < 0 ? 0 : len) {}

    [[nodiscard]] constexpr int32_t len() const noexcept { return len_; }

    [[nodiscard]] constexpr DistanceBand band() const noexcept {
        if (len_ <= kNearLimit) { return DistanceBand::Near; }
        if (len_ <= kMidLimit) { return DistanceBand::Mid; }
        return DistanceBand::Far;
    }

    constexpr auto operator<=>(const Distance&) const = default;

private:
    int32_t len_ = 0;
};

/// A place the character can stand on.
class Location {
public:
    Location() = default;
    Location(std::string path, Distance distance, bool home = false, bool dataDir = false)
        : path_(std::move(path)), distance_(distance), home_(home), dataDir_(dataDir) {}

    /// The home location: distance zero.
    static Location Home(std::string path = "~") {
        return Location(std::move(path), Distance(0), true, false);
    }

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] Distance DistanceFromHome() const noexcept { return distance_; }
    [[nodiscard]] bool IsHome() const noexcept { return home_; }

    /// True inside the game's own data directory.
    [[nodiscard]] bool IsDataDir() const noexcept { return dataDir_; }

    bool operator==(const Location& other) const { return path_ == other.path_; }

private:
    std::string path_ = "~";
    Distance distance_;
    bool home_ = true;
    bool dataDir_ = false;
};

}  // namespace dcr::game
