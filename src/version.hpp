#pragma once

// Build/version info.
//
// CMake defines STAMPWALK_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef STAMPWALK_VERSION
#define STAMPWALK_VERSION "dev"
#endif

#ifndef STAMPWALK_APPNAME
#define STAMPWALK_APPNAME "StampWalk"
#endif
