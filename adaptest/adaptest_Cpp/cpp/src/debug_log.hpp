#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace cat::detail {

inline bool debug_enabled() {
  static const bool enabled = [] {
    const char* env = std::getenv("CAT_DEBUG_SESSION");
    if (!env) {
      env = std::getenv("CAT_DEBUG");
    }
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(const char* component, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[cat:" << component << "] " << message << std::endl;
  }
}

} // namespace cat::detail
