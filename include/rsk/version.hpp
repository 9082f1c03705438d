#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define RSK_VERSION_MAJOR 0
#define RSK_VERSION_MINOR 3
#define RSK_VERSION_PATCH 0
#define RSK_VERSION_STRING "0.3.0"

namespace rsk {

/// Library version information at compile time.
struct Version {
    static constexpr int major = RSK_VERSION_MAJOR;
    static constexpr int minor = RSK_VERSION_MINOR;
    static constexpr int patch = RSK_VERSION_PATCH;
    static constexpr const char* string = RSK_VERSION_STRING;
};

} // namespace rsk
