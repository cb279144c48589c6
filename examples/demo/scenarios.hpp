#pragma once

/** \file scenarios.hpp
 *  \brief Console walkthroughs of the rule library: simple rules, 3PL warehouse rules and an
 *         attribute expression query.
 *
 * Each scenario writes its report to the given stream so it can be captured. A scenario
 * fails only when a rule or the sample data rejects its parameters.
 */

#include <cstdint>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "criteria/error.hpp"
#include "criteria/wms/clock.hpp"

namespace criteria::demo {

struct demo_options {
  std::string domestic_country{"USA"};
  int cycle_count_days{30};
  int expiring_days{30};
  int urgent_days{7};
  wms::wall_clock clock{};
};

enum class scenario_group : std::uint8_t { simple, warehouse, query };

using scenario_result = std::expected<void, core::error>;
using scenario_fn = scenario_result (*)(std::ostream&, const demo_options&);

struct scenario {
  std::string_view name;   /**< command-line name, e.g. "low-stock" */
  std::string_view title;
  scenario_group group;
  scenario_fn run;
};

// Simple rules
auto user_validation(std::ostream& out, const demo_options& opts) -> scenario_result;
auto email_validation(std::ostream& out, const demo_options& opts) -> scenario_result;
auto number_ranges(std::ostream& out, const demo_options& opts) -> scenario_result;
auto password_strength(std::ostream& out, const demo_options& opts) -> scenario_result;
auto not_operator(std::ostream& out, const demo_options& opts) -> scenario_result;

// Warehouse rules over the sample data set
auto low_stock_premium_clients(std::ostream& out, const demo_options& opts) -> scenario_result;
auto expedited_orders(std::ostream& out, const demo_options& opts) -> scenario_result;
auto special_handling_locations(std::ostream& out, const demo_options& opts) -> scenario_result;
auto expiring_inventory(std::ostream& out, const demo_options& opts) -> scenario_result;
auto order_batching(std::ostream& out, const demo_options& opts) -> scenario_result;
auto sla_compliance(std::ostream& out, const demo_options& opts) -> scenario_result;
auto cycle_count_priorities(std::ostream& out, const demo_options& opts) -> scenario_result;
auto international_compliance(std::ostream& out, const demo_options& opts) -> scenario_result;

/** \brief Products selected by a filter_expr over product attributes. */
auto attribute_query(std::ostream& out, const demo_options& opts) -> scenario_result;

/** \brief All scenarios in menu order. */
[[nodiscard]] auto catalog() -> std::span<const scenario>;

[[nodiscard]] auto find_scenario(std::string_view name) -> const scenario*;

/**
 * \brief Menu selection within a group: `choice` is a 1-based position among the group's
 *        scenarios in catalog order. Null unless the whole of `choice` is an in-range number.
 */
[[nodiscard]] auto pick_in_group(scenario_group group, std::string_view choice) -> const scenario*;

/** \brief Run one scenario with a trace line around it. */
auto run_scenario(const scenario& s, std::ostream& out, const demo_options& opts) -> scenario_result;

/** \brief Run every scenario of a group in order; stops at the first failure. */
auto run_group(scenario_group group, std::ostream& out, const demo_options& opts) -> scenario_result;

/** \brief Run the whole catalog; stops at the first failure. */
auto run_all(std::ostream& out, const demo_options& opts) -> scenario_result;

} // namespace criteria::demo
