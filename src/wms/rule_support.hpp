#pragma once

// Shared helpers for the warehouse records and rule factories. Not installed.

#include <expected>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "criteria/core/text.hpp"
#include "criteria/core/trace.hpp"
#include "criteria/error.hpp"

namespace criteria::wms::detail {

inline auto reject(std::string message, const char* component) -> std::unexpected<core::error> {
  return std::unexpected(core::trace_rejection(
      core::error{core::error_code::invalid_argument, std::move(message), component}));
}

inline auto require_non_blank(std::string_view value, const char* what, const char* component)
    -> std::expected<void, core::error> {
  if (core::is_blank(value)) return reject(std::string(what) + " must not be blank", component);
  return {};
}

inline auto tagged(const char* rule, std::string_view arg) -> std::string {
  std::string out(rule);
  out += '[';
  out += arg;
  out += ']';
  return out;
}

inline auto tagged(const char* rule, double arg) -> std::string {
  std::ostringstream os;
  os << rule << '[' << arg << ']';
  return os.str();
}

} // namespace criteria::wms::detail
