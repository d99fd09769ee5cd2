/// @file ecs_logger.cpp
/// @brief Category filtering in front of kcenon's default logger.

#include "es/foundation/ecs_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace es::foundation {

namespace {

namespace kci = kcenon::common::interfaces;

// Indexed by LogLevel.
constexpr std::array<kci::log_level, 7> kKcenonLevels = {
    kci::log_level::trace,   kci::log_level::debug, kci::log_level::info,
    kci::log_level::warning, kci::log_level::error, kci::log_level::critical,
    kci::log_level::off,
};

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// "[Category] message", followed by " {key=value, ...}" when @p ctx
/// carries any field.
std::string formatRecord(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string record;
    record.reserve(msg.size() + 32);
    record.append("[").append(logCategoryName(cat)).append("] ").append(msg);
    if (ctx == nullptr) {
        return record;
    }

    std::vector<std::pair<std::string_view, std::string_view>> fields;
    if (ctx->entity && !ctx->entity->empty()) {
        fields.emplace_back("entity", *ctx->entity);
    }
    if (ctx->component && !ctx->component->empty()) {
        fields.emplace_back("component", *ctx->component);
    }
    for (const auto& [key, value] : ctx->extra) {
        fields.emplace_back(key, value);
    }
    if (fields.empty()) {
        return record;
    }

    record += " {";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            record += ", ";
        }
        record.append(fields[i].first).append("=").append(fields[i].second);
    }
    record += '}';
    return record;
}

void emit(LogLevel level, const std::string& record) {
    auto idx = static_cast<std::size_t>(level);
    auto mapped = idx < kKcenonLevels.size() ? kKcenonLevels[idx] : kci::log_level::info;
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    // Write failures are dropped.
    auto result = logger->log(mapped, record);
    static_cast<void>(result);
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (equalsIgnoreCase(name, "warn")) {
        return LogLevel::Warning;
    }
    for (std::size_t i = 0; i < kKcenonLevels.size(); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (equalsIgnoreCase(name, logLevelName(level))) {
            return level;
        }
    }
    return std::nullopt;
}

struct EcsLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minLevels;

    Impl() {
        for (auto& level : minLevels) {
            level.store(LogLevel::Info, std::memory_order_relaxed);
        }
    }

    /// Threshold slot for @p cat, or nullptr for an out-of-range category.
    std::atomic<LogLevel>* threshold(LogCategory cat) {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &minLevels[idx] : nullptr;
    }
    const std::atomic<LogLevel>* threshold(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &minLevels[idx] : nullptr;
    }
};

EcsLogger::EcsLogger() : impl_(std::make_unique<Impl>()) {}

EcsLogger::~EcsLogger() = default;

EcsLogger::EcsLogger(EcsLogger&&) noexcept = default;
EcsLogger& EcsLogger::operator=(EcsLogger&&) noexcept = default;

void EcsLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        emit(level, formatRecord(cat, msg, nullptr));
    }
}

void EcsLogger::logWithContext(LogLevel level, LogCategory cat,
                               std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        emit(level, formatRecord(cat, msg, &ctx));
    }
}

void EcsLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (auto* slot = impl_->threshold(cat)) {
        slot->store(minLevel, std::memory_order_release);
    }
}

LogLevel EcsLogger::getCategoryLevel(LogCategory cat) const {
    const auto* slot = impl_->threshold(cat);
    return slot != nullptr ? slot->load(std::memory_order_acquire) : LogLevel::Off;
}

bool EcsLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    const auto* slot = impl_->threshold(cat);
    return slot != nullptr &&
           static_cast<uint8_t>(level) >=
               static_cast<uint8_t>(slot->load(std::memory_order_acquire));
}

EcsResult<void> EcsLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (logger->flush().is_err()) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return EcsResult<void>::ok();
}

EcsLogger& EcsLogger::instance() {
    static EcsLogger inst;
    return inst;
}

} // namespace es::foundation
