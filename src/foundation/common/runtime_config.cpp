#include "es/foundation/runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace es::foundation {

namespace {

std::string levelKey(LogCategory cat) {
    std::string name(logCategoryName(cat));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "logging." + name;
}

} // namespace

EcsResult<RuntimeConfig> loadRuntimeConfig(const ConfigManager& config) {
    RuntimeConfig cfg;

    if (config.hasKey("ecs.initial_capacity")) {
        auto capacity = config.get<long long>("ecs.initial_capacity");
        if (!capacity) {
            return EcsResult<RuntimeConfig>::err(capacity.error());
        }
        if (capacity.value() < 0) {
            return EcsResult<RuntimeConfig>::err(
                EcsError(ErrorCode::ConfigTypeMismatch,
                         "ecs.initial_capacity must not be negative"));
        }
        if (static_cast<unsigned long long>(capacity.value()) > kMaxInitialCapacity) {
            return EcsResult<RuntimeConfig>::err(
                EcsError(ErrorCode::ConfigTypeMismatch,
                         "ecs.initial_capacity exceeds the entity index space (" +
                             std::to_string(kMaxInitialCapacity) + ")"));
        }
        cfg.initialCapacity = static_cast<std::size_t>(capacity.value());
    }

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        const auto key = levelKey(static_cast<LogCategory>(i));
        if (!config.hasKey(key)) {
            continue;
        }
        auto name = config.get<std::string>(key);
        if (!name) {
            return EcsResult<RuntimeConfig>::err(name.error());
        }
        auto level = parseLogLevel(name.value());
        if (!level) {
            return EcsResult<RuntimeConfig>::err(
                EcsError(ErrorCode::ConfigTypeMismatch,
                         "unknown log level '" + name.value() + "' for " + key));
        }
        cfg.categoryLevels[i] = *level;
    }

    return EcsResult<RuntimeConfig>::ok(cfg);
}

void applyLogLevels(const RuntimeConfig& cfg, EcsLogger& logger) {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<LogCategory>(i), cfg.categoryLevels[i]);
    }
}

} // namespace es::foundation
