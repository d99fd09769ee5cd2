#include "es/foundation/config_manager.hpp"

#include "es/foundation/ecs_logger.hpp"

namespace es::foundation {

EcsResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    Entries loaded;
    try {
        auto root = YAML::LoadFile(path.string());
        flatten("", root, loaded);
    } catch (const YAML::BadFile&) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::Exception& e) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::ConfigLoadFailed, std::string("YAML error: ") + e.what()));
    }
    entries_.swap(loaded);
    ES_LOG_INFO(LogCategory::Config, "loaded " + path.string());
    return EcsResult<void>::ok();
}

EcsResult<void> ConfigManager::loadFromString(std::string_view document) {
    std::lock_guard lock(mutex_);
    Entries loaded;
    try {
        auto root = YAML::Load(std::string(document));
        flatten("", root, loaded);
    } catch (const YAML::Exception& e) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::ConfigLoadFailed, std::string("YAML error: ") + e.what()));
    }
    entries_.swap(loaded);
    return EcsResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        out.push_back(key);
    }
    return out;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node,
                            Entries& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        out[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Copy the callbacks so a watcher may call back into the manager.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace es::foundation
