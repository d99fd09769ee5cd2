#pragma once

/// @file runtime_config.hpp
/// @brief Typed runtime settings for entity managers and logging.

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

#include "es/foundation/config_manager.hpp"
#include "es/foundation/ecs_logger.hpp"
#include "es/foundation/ecs_result.hpp"

namespace es::foundation {

/// Largest accepted `ecs.initial_capacity`: the number of addressable
/// entity indices (every 32-bit value but the invalid sentinel).
inline constexpr std::size_t kMaxInitialCapacity = std::numeric_limits<uint32_t>::max();

/// Settings consumed by EntityManager construction and the logger.
///
/// YAML layout:
/// @code
///   ecs:
///     initial_capacity: 4096
///   logging:
///     entity: debug
///     system: warning
/// @endcode
struct RuntimeConfig {
    /// Number of entity slots reserved up front in the allocator and
    /// every component storage.
    std::size_t initialCapacity = 0;

    /// Minimum log level per LogCategory, indexed by the enum value.
    std::array<LogLevel, kLogCategoryCount> categoryLevels = {
        LogLevel::Info, LogLevel::Info, LogLevel::Info, LogLevel::Info,
        LogLevel::Info, LogLevel::Info, LogLevel::Info
    };
};

/// Build a RuntimeConfig from `ecs.*` and `logging.*` keys.
///
/// Missing keys keep their defaults.  A present but malformed value
/// (negative or oversized capacity, unknown level name) fails with
/// ConfigTypeMismatch.
EcsResult<RuntimeConfig> loadRuntimeConfig(const ConfigManager& config);

/// Push the configured per-category levels into @p logger.
void applyLogLevels(const RuntimeConfig& cfg, EcsLogger& logger);

} // namespace es::foundation
