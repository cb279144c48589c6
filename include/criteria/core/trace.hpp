#pragma once

/** \file trace.hpp
 *  \brief Opt-in diagnostic output on stderr, gated by CRITERIA_TRACE.
 *
 * Lines are tagged "[criteria][component] ...". The flag is read once per process.
 */

#include <iostream>
#include <string_view>

#include "criteria/core/platform_utils.hpp"
#include "criteria/error.hpp"

namespace criteria::core {

inline auto trace_enabled() -> bool {
  static const bool enabled = env_flag("CRITERIA_TRACE");
  return enabled;
}

inline void trace(std::string_view component, std::string_view message) {
  if (!trace_enabled()) return;
  std::cerr << "[criteria][" << component << "] " << message << std::endl;
}

/** \brief Trace a construction rejection and hand the error back for std::unexpected. */
inline auto trace_rejection(error e) -> error {
  if (trace_enabled()) {
    std::cerr << "[criteria][" << e.component << "] rejected: " << e.message
              << " (" << to_string(e.code) << ")" << std::endl;
  }
  return e;
}

} // namespace criteria::core
