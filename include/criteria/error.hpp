#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 * - Construction of predicates and domain records reports failures through
 *   std::expected<T, core::error>; evaluation never fails.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace criteria::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "core.composite" */
};

/** \brief Stable lower-case name of an error code ("invalid_argument", ...). */
[[nodiscard]] auto to_string(error_code code) noexcept -> std::string_view;

/** \brief "component: message (code_name)" rendering for diagnostics. */
[[nodiscard]] auto describe(const error& e) -> std::string;

} // namespace criteria::core
