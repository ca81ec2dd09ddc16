#pragma once

#include <string>

namespace eegpad {

// CMake defines EEGPAD_VERSION_STRING from project(VERSION ...) for every
// target that links the eegpad library.
#ifndef EEGPAD_VERSION_STRING
  #define EEGPAD_VERSION_STRING "0.0.0"
#endif

inline std::string version_string() {
  return EEGPAD_VERSION_STRING;
}

inline std::string build_type_string() {
#ifdef NDEBUG
  return "Release";
#else
  return "Debug";
#endif
}

} // namespace eegpad
