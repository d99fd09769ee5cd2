#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "es/foundation/ecs_result.hpp"

namespace es::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration store providing typed access to values.
///
/// Supports loading from a file or an in-memory document, dotted-key
/// access (e.g., "ecs.initial_capacity"), setting values at runtime, and
/// registering callbacks for change notification.
///
/// The YAML tree is flattened into a key-value map on load.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return ok, or ConfigLoadFailed when the file cannot be read or parsed.
    EcsResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    EcsResult<void> loadFromString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    EcsResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.  Notifies watchers for this key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys currently held, in unspecified order.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    using Entries = std::unordered_map<std::string, YAML::Node>;

    /// Flatten @p node into @p out under dotted keys.  Throws
    /// YAML::Exception for keys that are not scalars.
    static void flatten(const std::string& prefix, const YAML::Node& node, Entries& out);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    Entries entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
EcsResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EcsResult<T>::err(
            EcsError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EcsResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EcsResult<T>::err(
            EcsError(ErrorCode::ConfigTypeMismatch,
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

} // namespace es::foundation
