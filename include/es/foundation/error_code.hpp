#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the entity system.

#include <cstdint>
#include <string_view>

namespace es::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0300 - 0x03FF)
    StaleEntity = 0x0300,
    InvalidEntity = 0x0301,
    MissingComponent = 0x0302,
    DoubleDelete = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0800,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Return the symbolic name of an error code.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown:            return "Unknown";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::AlreadyExists:      return "AlreadyExists";
        case ErrorCode::StaleEntity:        return "StaleEntity";
        case ErrorCode::InvalidEntity:      return "InvalidEntity";
        case ErrorCode::MissingComponent:   return "MissingComponent";
        case ErrorCode::DoubleDelete:       return "DoubleDelete";
        case ErrorCode::ConfigLoadFailed:   return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound:  return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::LoggerFlushFailed:  return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace es::foundation
