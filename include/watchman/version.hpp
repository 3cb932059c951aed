/*
 * Version macros for watchman.
 *
 * The build system passes WATCHMAN_VERSION_* as compile definitions; the
 * fallbacks below keep the headers usable outside of it.
 */

#pragma once

#ifndef WATCHMAN_VERSION_MAJOR
#define WATCHMAN_VERSION_MAJOR 0
#endif

#ifndef WATCHMAN_VERSION_MINOR
#define WATCHMAN_VERSION_MINOR 0
#endif

#ifndef WATCHMAN_VERSION_PATCH
#define WATCHMAN_VERSION_PATCH 0
#endif

#ifndef WATCHMAN_VERSION_STRING
#define WATCHMAN_VERSION_STRING "0.0.0+dev"
#endif

namespace watchman {

inline constexpr const char* kVersionString = WATCHMAN_VERSION_STRING;

} // namespace watchman
