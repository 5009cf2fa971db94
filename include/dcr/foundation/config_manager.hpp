#pragma once

/// @file config_manager.hpp
/// @brief YAML settings addressed by dotted keys.

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "dcr/foundation/game_result.hpp"

namespace dcr::foundation {

/// Flat view of a YAML document.
///
/// Nested maps become dotted keys: `rules: {xp: {base: 100}}` is read
/// back as get<int>("rules.xp.base"). Sequences and scalars are leaves.
/// A load replaces everything previously loaded or set.
///
/// @code
///   ConfigManager config;
///   if (auto r = config.load("config/dircrawl.yaml"); !r) {
///       DCR_LOG_ERROR(LogCategory::Config, r.error().describe());
///   }
///   auto rules = LoadGameRules(config);
/// @endcode
class ConfigManager {
public:
    /// @return ConfigLoadFailed when the file is missing or malformed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Same as load() for an in-memory document.
    GameResult<void> loadString(std::string_view document);

    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Override one key, e.g. from a command line flag.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Every leaf key starting with @p prefix, sorted.
    [[nodiscard]] std::vector<std::string> keys(std::string_view prefix = {}) const;

private:
    GameResult<void> adopt(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::map<std::string, YAML::Node, std::less<>> entries_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return fail<T>(ErrorCode::ConfigKeyNotFound, "config key not found: " + std::string(key));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return fail<T>(ErrorCode::ConfigTypeMismatch, "type mismatch for key: " + std::string(key));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_.insert_or_assign(std::string(key), YAML::Node(value));
}

}  // namespace dcr::foundation
