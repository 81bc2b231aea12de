#pragma once

#include <string>

// Build metadata for GeoCity.
//
// CMake defines these through geocity_core's PUBLIC compile definitions.
// The fallbacks keep the header usable outside a CMake build.

#ifndef GEOCITY_VERSION_STRING
#define GEOCITY_VERSION_STRING "0.0.0"
#endif

#ifndef GEOCITY_GIT_SHA
#define GEOCITY_GIT_SHA "unknown"
#endif

namespace geocity {

inline constexpr const char* GeoCityVersionString() { return GEOCITY_VERSION_STRING; }

// "1.2.3" or "1.2.3 (abc1234)" when the build knows its commit.
inline std::string GeoCityFullVersionString()
{
  std::string s = GeoCityVersionString();
  const std::string sha = GEOCITY_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace geocity
