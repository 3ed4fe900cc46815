/*
 * Fallback version header for cleanbench
 *
 * The CMake build passes the project version as compile definitions; these
 * defaults keep the header usable when it is included without them.
 */

#pragma once

#ifndef CLEANBENCH_VERSION_MAJOR
#define CLEANBENCH_VERSION_MAJOR 0
#endif

#ifndef CLEANBENCH_VERSION_MINOR
#define CLEANBENCH_VERSION_MINOR 0
#endif

#ifndef CLEANBENCH_VERSION_PATCH
#define CLEANBENCH_VERSION_PATCH 0
#endif

#ifndef CLEANBENCH_VERSION_STRING
#define CLEANBENCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef CLEANBENCH_BUILD_DATE
#define CLEANBENCH_BUILD_DATE __DATE__ " " __TIME__
#endif

// Long version string: "X.Y.Z (built: Mon DD YYYY HH:MM:SS)"
#ifndef CLEANBENCH_VERSION_LONG_STRING
#define CLEANBENCH_VERSION_LONG_STRING                                                             \
    CLEANBENCH_VERSION_STRING " (built: " CLEANBENCH_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace cleanbench {
namespace version {
constexpr int major_v = CLEANBENCH_VERSION_MAJOR;
constexpr int minor_v = CLEANBENCH_VERSION_MINOR;
constexpr int patch_v = CLEANBENCH_VERSION_PATCH;
constexpr const char* string_v = CLEANBENCH_VERSION_STRING;
constexpr const char* long_string_v = CLEANBENCH_VERSION_LONG_STRING;
} // namespace version
} // namespace cleanbench
#endif
