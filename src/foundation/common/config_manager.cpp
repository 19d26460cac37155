#include "sgov/foundation/config_manager.hpp"

#include <set>

namespace sgov::foundation {

GovernorResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GovernorResult<void>::err(
            GovernorError(ErrorCode::ConfigLoadFailed,
                          "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GovernorResult<void>::err(
            GovernorError(ErrorCode::ConfigLoadFailed,
                          std::string("YAML parse error: ") + e.what()));
    }
}

GovernorResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return replaceRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GovernorResult<void>::err(
            GovernorError(ErrorCode::ConfigLoadFailed,
                          std::string("YAML parse error: ") + e.what()));
    }
}

GovernorResult<void> ConfigManager::replaceRoot(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsNull()) {
        return GovernorResult<void>::ok();
    }
    if (!root.IsMap()) {
        return GovernorResult<void>::err(
            GovernorError(ErrorCode::ConfigLoadFailed,
                          "configuration root must be a mapping"));
    }
    flatten("", root);
    return GovernorResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head(prefix);
    if (!head.empty()) {
        head += '.';
    }

    std::set<std::string> children;
    for (const auto& [key, node] : entries_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = std::string_view(key).substr(head.size());
        children.emplace(rest.substr(0, rest.find('.')));
    }
    return {children.begin(), children.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked unlocked so a callback may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace sgov::foundation
