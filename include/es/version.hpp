#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ES_VERSION_MAJOR 0
#define ES_VERSION_MINOR 3
#define ES_VERSION_PATCH 0
#define ES_VERSION_STRING "0.3.0"

namespace es {

/// Project version information at compile time.
struct Version {
    static constexpr int major = ES_VERSION_MAJOR;
    static constexpr int minor = ES_VERSION_MINOR;
    static constexpr int patch = ES_VERSION_PATCH;
    static constexpr const char* string = ES_VERSION_STRING;
};

} // namespace es
