#pragma once

/// @file class_catalog.hpp
/// @brief Immutable table of character archetypes loaded from YAML.
///
/// The catalog must be loaded before the first spawn call; it is handed
/// to every system through the GameContext. Characters clone the Class
/// they are built from, so a spawned enemy may alter its copy freely.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dcr/foundation/game_result.hpp"
#include "dcr/game/character_types.hpp"

namespace dcr::game {

/// A (base, growth) pair. Value at level L is base + growth * (L - 1).
struct Stat {
    int32_t base = 0;
    int32_t growth = 0;

    [[nodiscard]] constexpr int32_t At(int32_t level) const noexcept {
        return base + growth * (level > 1 ? level - 1 : 0);
    }
};

/// Chance for an enemy hit to apply a status effect.
struct StatusInfliction {
    StatusEffect effect = StatusEffect::Burn;
    uint32_t oneIn = 1;
};

/// Character archetype.
struct Class {
    std::string name;
    Category category = Category::Common;
    Stat hp;
    Stat strength;
    Stat speed;
    Stat mp;
    std::optional<StatusInfliction> inflicts;

    /// Family name: the part of the name before the first space.
    [[nodiscard]] std::string_view BaseName() const noexcept {
        std::string_view view(name);
        return view.substr(0, view.find(' '));
    }
};

/// Read-only class table.
class ClassCatalog {
public:
    /// Validate and adopt a list of classes.
    ///
    /// Rejects empty or duplicate names, negative base stats or growth,
    /// and tables without a Player class (CatalogInvalid).
    [[nodiscard]] static foundation::GameResult<ClassCatalog> FromClasses(
        std::vector<Class> classes);

    /// Parse a YAML document with a top-level "classes" sequence.
    [[nodiscard]] static foundation::GameResult<ClassCatalog> Parse(std::string_view document);

    [[nodiscard]] static foundation::GameResult<ClassCatalog> LoadFile(
        const std::filesystem::path& path);

    /// Lookup by exact (lower-case) name.
    [[nodiscard]] const Class* Find(std::string_view name) const;

    /// Lookup restricted to one category.
    [[nodiscard]] const Class* Find(std::string_view name, Category category) const;

    /// First Player class in declaration order; the default hero.
    [[nodiscard]] const Class& PlayerFirst() const;

    [[nodiscard]] std::vector<const Class*> ByCategory(Category category) const;

    /// Common, Rare and Legendary classes, in declaration order.
    [[nodiscard]] std::vector<const Class*> Enemies() const;

    [[nodiscard]] std::vector<std::string> Names(Category category) const;

    [[nodiscard]] std::size_t Size() const noexcept { return classes_.size(); }

private:
    explicit ClassCatalog(std::vector<Class> classes) : classes_(std::move(classes)) {}

    std::vector<Class> classes_;
};

}  // namespace dcr::game
