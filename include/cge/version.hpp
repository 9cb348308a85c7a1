#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CGE_VERSION_MAJOR 0
#define CGE_VERSION_MINOR 1
#define CGE_VERSION_PATCH 0
#define CGE_VERSION_STRING "0.1.0"

namespace cge {

/// Engine version information at compile time.
struct Version {
    static constexpr int major = CGE_VERSION_MAJOR;
    static constexpr int minor = CGE_VERSION_MINOR;
    static constexpr int patch = CGE_VERSION_PATCH;
    static constexpr const char* string = CGE_VERSION_STRING;
};

} // namespace cge
