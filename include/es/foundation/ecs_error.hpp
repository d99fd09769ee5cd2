#pragma once

/// @file ecs_error.hpp
/// @brief Entity-system error type used with Result<T, EcsError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "es/foundation/error_code.hpp"

namespace es::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data (usually the offending Entity).
class EcsError {
public:
    EcsError() = default;

    explicit EcsError(ErrorCode code)
        : code_(code) {}

    EcsError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    EcsError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for errors caused by a handle that no longer addresses a live
    /// entity.  DoubleDelete is the deletion flavour of StaleEntity.
    [[nodiscard]] bool isStaleEntity() const noexcept {
        return code_ == ErrorCode::StaleEntity || code_ == ErrorCode::DoubleDelete;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace es::foundation
