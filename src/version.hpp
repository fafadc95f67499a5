#pragma once

// Build/version info.
//
// CMake defines DELVECORE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DELVECORE_VERSION
#define DELVECORE_VERSION "dev"
#endif

#ifndef DELVECORE_APPNAME
#define DELVECORE_APPNAME "DelveCore"
#endif
