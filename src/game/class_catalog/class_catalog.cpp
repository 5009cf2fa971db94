/// @file class_catalog.cpp
/// @brief ClassCatalog loading and validation.

#include "dcr/game/class_catalog.hpp"

#include <algorithm>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::ErrorCode;
using foundation::fail;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<ClassCatalog> invalid(std::string message) {
    DCR_LOG_ERROR(LogCategory::Config, "class catalog rejected: " + message);
    return fail<ClassCatalog>(ErrorCode::CatalogInvalid, std::move(message));
}

/// Parse a "[base, growth]" sequence. Throws YAML exceptions on bad input.
Stat parseStat(const YAML::Node& node, const std::string& className, const char* field) {
    if (!node || !node.IsSequence() || node.size() != 2) {
        throw YAML::Exception(YAML::Mark::null_mark(),
                              className + ": '" + field + "' must be [base, growth]");
    }
    return Stat{node[0].as<int32_t>(), node[1].as<int32_t>()};
}

Class parseClass(const YAML::Node& node) {
    Class cls;
    cls.name = node["name"].as<std::string>();

    auto categoryText = node["category"].as<std::string>();
    auto category = parseCategory(categoryText);
    if (!category) {
        throw YAML::Exception(YAML::Mark::null_mark(),
                              cls.name + ": unknown category '" + categoryText + "'");
    }
    cls.category = *category;

    cls.hp = parseStat(node["hp"], cls.name, "hp");
    cls.strength = parseStat(node["strength"], cls.name, "strength");
    cls.speed = parseStat(node["speed"], cls.name, "speed");
    if (node["mp"]) {
        cls.mp = parseStat(node["mp"], cls.name, "mp");
    }

    if (auto inflicts = node["inflicts"]) {
        auto effectText = inflicts["effect"].as<std::string>();
        auto effect = parseStatusEffect(effectText);
        if (!effect) {
            throw YAML::Exception(YAML::Mark::null_mark(),
                                  cls.name + ": unknown status effect '" + effectText + "'");
        }
        cls.inflicts = StatusInfliction{*effect, inflicts["one_in"].as<uint32_t>()};
    }
    return cls;
}

GameResult<ClassCatalog> parseRoot(const YAML::Node& root) {
    auto list = root["classes"];
    if (!list || !list.IsSequence()) {
        return invalid("missing top-level 'classes' sequence");
    }
    std::vector<Class> classes;
    classes.reserve(list.size());
    for (const auto& node : list) {
        classes.push_back(parseClass(node));
    }
    return ClassCatalog::FromClasses(std::move(classes));
}

} // namespace

GameResult<ClassCatalog> ClassCatalog::FromClasses(std::vector<Class> classes) {
    std::unordered_set<std::string> seen;
    bool hasPlayer = false;
    for (const auto& cls : classes) {
        if (cls.name.empty()) {
            return invalid("class with empty name");
        }
        if (!seen.insert(cls.name).second) {
            return invalid("duplicate class '" + cls.name + "'");
        }
        for (const Stat* stat : {&cls.hp, &cls.strength, &cls.speed, &cls.mp}) {
            if (stat->base < 0 || stat->growth < 0) {
                return invalid(cls.name + ": stats and growth must not be negative");
            }
        }
        if (cls.hp.base <= 0) {
            return invalid(cls.name + ": base hp must be positive");
        }
        if (cls.inflicts && cls.inflicts->oneIn == 0) {
            return invalid(cls.name + ": inflicts.one_in must be positive");
        }
        hasPlayer = hasPlayer || cls.category == Category::Player;
    }
    if (!hasPlayer) {
        return invalid("at least one player class is required");
    }
    return GameResult<ClassCatalog>::ok(ClassCatalog(std::move(classes)));
}

GameResult<ClassCatalog> ClassCatalog::Parse(std::string_view document) {
    try {
        return parseRoot(YAML::Load(std::string(document)));
    } catch (const YAML::Exception& e) {
        return fail<ClassCatalog>(ErrorCode::CatalogLoadFailed,
                                  std::string("class catalog: ") + e.what());
    }
}

GameResult<ClassCatalog> ClassCatalog::LoadFile(const std::filesystem::path& path) {
    try {
        auto catalog = parseRoot(YAML::LoadFile(path.string()));
        if (catalog) {
            DCR_LOG_INFO(LogCategory::Config,
                         "loaded " + std::to_string(catalog.value().Size()) +
                         " classes from " + path.string());
        }
        return catalog;
    } catch (const YAML::BadFile&) {
        return fail<ClassCatalog>(ErrorCode::CatalogLoadFailed,
                                  "failed to open class file: " + path.string());
    } catch (const YAML::Exception& e) {
        return fail<ClassCatalog>(ErrorCode::CatalogLoadFailed,
                                  std::string("class catalog: ") + e.what());
    }
}

const Class* ClassCatalog::Find(std::string_view name) const {
    auto it = std::find_if(classes_.begin(), classes_.end(),
                           [name](const Class& c) { return c.name == name; });
    return it != classes_.end() ? &(*it) : nullptr;
}

const Class* ClassCatalog::Find(std::string_view name, Category category) const {
    const Class* cls = Find(name);
    return (cls && cls->category == category) ? cls : nullptr;
}

const Class& ClassCatalog::PlayerFirst() const {
    // FromClasses guarantees a player class exists.
    return *std::find_if(classes_.begin(), classes_.end(),
                         [](const Class& c) { return c.category == Category::Player; });
}

std::vector<const Class*> ClassCatalog::ByCategory(Category category) const {
    std::vector<const Class*> result;
    for (const auto& cls : classes_) {
        if (cls.category == category) {
            result.push_back(&cls);
        }
    }
    return result;
}

std::vector<const Class*> ClassCatalog::Enemies() const {
    std::vector<const Class*> result;
    for (const auto& cls : classes_) {
        if (cls.category == Category::Common || cls.category == Category::Rare ||
            cls.category == Category::Legendary) {
            result.push_back(&cls);
        }
    }
    return result;
}

std::vector<std::string> ClassCatalog::Names(Category category) const {
    std::vector<std::string> names;
    for (const auto* cls : ByCategory(category)) {
        names.push_back(cls->name);
    }
    return names;
}

}  // namespace dcr::game
