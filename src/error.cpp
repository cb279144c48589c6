#include "criteria/error.hpp"

namespace criteria::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::string out;
  out.reserve(e.component.size() + e.message.size() + 24);
  if (!e.component.empty()) {
    out += e.component;
    out += ": ";
  }
  out += e.message;
  out += " (";
  out += to_string(e.code);
  out += ")";
  return out;
}

} // namespace criteria::core
