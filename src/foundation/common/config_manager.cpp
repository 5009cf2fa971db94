/// @file config_manager.cpp
/// @brief ConfigManager implementation.

#include "dcr/foundation/config_manager.hpp"

namespace dcr::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return fail<void>(ErrorCode::ConfigLoadFailed, "cannot open " + path.string());
    } catch (const YAML::ParserException& e) {
        return fail<void>(ErrorCode::ConfigLoadFailed, path.string() + ": " + e.what());
    }
    return adopt(root);
}

GameResult<void> ConfigManager::loadString(std::string_view document) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return fail<void>(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what());
    }
    return adopt(root);
}

GameResult<void> ConfigManager::adopt(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        return fail<void>(ErrorCode::ConfigLoadFailed, "top level of a config must be a map");
    }
    entries_.clear();
    flatten("", root);
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

std::vector<std::string> ConfigManager::keys(std::string_view prefix) const {
    std::vector<std::string> found;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        found.push_back(it->first);
    }
    return found;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        if (!prefix.empty()) {
            entries_[prefix] = YAML::Clone(node);
        }
        return;
    }
    for (const auto& child : node) {
        auto name = child.first.as<std::string>();
        flatten(prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

}  // namespace dcr::foundation
