#pragma once

// Build/version info.
//
// CMake defines DISGUISER_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DISGUISER_VERSION
#define DISGUISER_VERSION "dev"
#endif

#ifndef DISGUISER_APPNAME
#define DISGUISER_APPNAME "Disguiser"
#endif
