/*
 * Fallback version header for snapfetch
 *
 * The build system passes the real values as compile definitions; these
 * defaults keep translation units compiling when it does not.
 */

#pragma once

#ifndef SNAPFETCH_VERSION_MAJOR
#define SNAPFETCH_VERSION_MAJOR 0
#endif

#ifndef SNAPFETCH_VERSION_MINOR
#define SNAPFETCH_VERSION_MINOR 0
#endif

#ifndef SNAPFETCH_VERSION_PATCH
#define SNAPFETCH_VERSION_PATCH 0
#endif

#ifndef SNAPFETCH_VERSION_STRING
#define SNAPFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef SNAPFETCH_USER_AGENT
#define SNAPFETCH_USER_AGENT "snapfetch/" SNAPFETCH_VERSION_STRING
#endif
