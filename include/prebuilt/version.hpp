/*
 * Fallback version header for prebuilt-fetch
 *
 * The build system passes PREBUILT_VERSION_* as compile definitions taken from
 * project(VERSION ...); these defaults only apply when compiling outside of it.
 */

#pragma once

#ifndef PREBUILT_VERSION_MAJOR
#define PREBUILT_VERSION_MAJOR 0
#endif

#ifndef PREBUILT_VERSION_MINOR
#define PREBUILT_VERSION_MINOR 0
#endif

#ifndef PREBUILT_VERSION_PATCH
#define PREBUILT_VERSION_PATCH 0
#endif

#ifndef PREBUILT_VERSION_STRING
#define PREBUILT_VERSION_STRING "0.0.0+dev"
#endif
