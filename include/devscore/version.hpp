/*
 * Version macros for devscore.
 *
 * CMake passes the real values as compile definitions; these defaults only
 * apply when the header is consumed outside that build.
 */

#pragma once

#ifndef DEVSCORE_VERSION_MAJOR
#define DEVSCORE_VERSION_MAJOR 0
#endif

#ifndef DEVSCORE_VERSION_MINOR
#define DEVSCORE_VERSION_MINOR 0
#endif

#ifndef DEVSCORE_VERSION_PATCH
#define DEVSCORE_VERSION_PATCH 0
#endif

#ifndef DEVSCORE_VERSION_STRING
#define DEVSCORE_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace devscore {
namespace version {
constexpr int major_v = DEVSCORE_VERSION_MAJOR;
constexpr int minor_v = DEVSCORE_VERSION_MINOR;
constexpr int patch_v = DEVSCORE_VERSION_PATCH;
constexpr const char* string_v = DEVSCORE_VERSION_STRING;
} // namespace version
} // namespace devscore
#endif
