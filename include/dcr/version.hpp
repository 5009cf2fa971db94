#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define DCR_VERSION_MAJOR 0
#define DCR_VERSION_MINOR 3
#define DCR_VERSION_PATCH 0
#define DCR_VERSION_STRING "0.3.0"

namespace dcr {

/// Project version information at compile time.
struct Version {
    static constexpr int major = DCR_VERSION_MAJOR;
    static constexpr int minor = DCR_VERSION_MINOR;
    static constexpr int patch = DCR_VERSION_PATCH;
    static constexpr const char* string = DCR_VERSION_STRING;
};

} // namespace dcr
