#pragma once

/// @file ecs_logger.hpp
/// @brief EcsLogger wrapping kcenon common_system logging for the entity system.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "es/foundation/ecs_result.hpp"

namespace es::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Library-wide messages
    Entity  = 1, ///< Entity lifecycle and handle validation
    Storage = 2, ///< Component storage access
    Query   = 3, ///< Query evaluation
    System  = 4, ///< System execution
    Event   = 5, ///< Event dispatch
    Config  = 6  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Entity", "Storage", "Query", "System", "Event", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "WARNING", ...).  Case-insensitive;
/// "warn" is accepted as an alias for "warning".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entity = "7v2";
///   ctx.component = "Position";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Entity,
///                         "stale handle", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> entity;
    std::optional<std::string> component;
    std::unordered_map<std::string, std::string> extra;
};

/// Entity-system logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Records that pass the per-category threshold (Info for every category
/// until changed) go to the default logger of kcenon's
/// GlobalLoggerRegistry, or its null logger when none is registered.
class EcsLogger {
public:
    EcsLogger();
    ~EcsLogger();

    // Non-copyable, movable.
    EcsLogger(const EcsLogger&) = delete;
    EcsLogger& operator=(const EcsLogger&) = delete;
    EcsLogger(EcsLogger&&) noexcept;
    EcsLogger& operator=(EcsLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    EcsResult<void> flush();

    /// Get the global EcsLogger singleton instance.
    static EcsLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace es::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name ES_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ES_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ES_MIN_LOG_LEVEL
    #define ES_MIN_LOG_LEVEL 0
#endif

#define ES_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= ES_MIN_LOG_LEVEL &&                       \
            ::es::foundation::EcsLogger::instance().isEnabled((level), (cat)))   \
        {                                                                        \
            ::es::foundation::EcsLogger::instance().log((level), (cat), (msg));  \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define ES_LOG_DEBUG(cat, msg) \
    ES_LOG(::es::foundation::LogLevel::Debug, (cat), (msg))

#define ES_LOG_INFO(cat, msg) \
    ES_LOG(::es::foundation::LogLevel::Info, (cat), (msg))

#define ES_LOG_WARN(cat, msg) \
    ES_LOG(::es::foundation::LogLevel::Warning, (cat), (msg))

#define ES_LOG_ERROR(cat, msg) \
    ES_LOG(::es::foundation::LogLevel::Error, (cat), (msg))

/// @}
