#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "sgov/foundation/governor_result.hpp"

namespace sgov::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from file or string, dotted-key access
/// (e.g., "governor.sources.helius.max_concurrent"), enumeration of the
/// children under a prefix, runtime overrides and change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file.
    /// @return Success or ConfigLoadFailed error.
    GovernorResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GovernorResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GovernorResult<T> get(std::string_view key) const;

    /// Set a value by dotted key. Notifies any registered watchers for this key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct immediate child names below @p prefix, sorted.
    ///
    /// With keys "a.x.n" and "a.y.n", childKeys("a") yields {"x", "y"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    GovernorResult<void> replaceRoot(const YAML::Node& root);

    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GovernorResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GovernorResult<T>::err(
            GovernorError(ErrorCode::ConfigKeyNotFound,
                          std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GovernorResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GovernorResult<T>::err(
            GovernorError(ErrorCode::ConfigTypeMismatch,
                          std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace sgov::foundation
