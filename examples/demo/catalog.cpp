#include "scenarios.hpp"

#include <array>
#include <charconv>
#include <cstddef>
#include <system_error>
#include <string>

#include "criteria/core/trace.hpp"

namespace criteria::demo {

namespace {

constexpr std::array<scenario, 14> kScenarios{{
    {"users", "User validation (age and status)", scenario_group::simple, &user_validation},
    {"emails", "Email validation (multiple rules)", scenario_group::simple, &email_validation},
    {"numbers", "Number range validation", scenario_group::simple, &number_ranges},
    {"passwords", "String content validation (passwords)", scenario_group::simple,
     &password_strength},
    {"not", "NOT operator", scenario_group::simple, &not_operator},
    {"low-stock", "Low stock alerts for premium clients", scenario_group::warehouse,
     &low_stock_premium_clients},
    {"expedited", "Expedited order processing", scenario_group::warehouse, &expedited_orders},
    {"special-handling", "Special handling location assignment", scenario_group::warehouse,
     &special_handling_locations},
    {"expiring", "Expiring inventory management", scenario_group::warehouse, &expiring_inventory},
    {"batching", "Order batching logic", scenario_group::warehouse, &order_batching},
    {"sla", "SLA compliance monitoring", scenario_group::warehouse, &sla_compliance},
    {"cycle-count", "Cycle count prioritization", scenario_group::warehouse,
     &cycle_count_priorities},
    {"international", "International shipment compliance", scenario_group::warehouse,
     &international_compliance},
    {"attribute-query", "Attribute expression query", scenario_group::query, &attribute_query},
}};

} // namespace

auto catalog() -> std::span<const scenario> { return kScenarios; }

auto find_scenario(std::string_view name) -> const scenario* {
  for (const auto& s : kScenarios) {
    if (s.name == name) return &s;
  }
  return nullptr;
}

auto pick_in_group(scenario_group group, std::string_view choice) -> const scenario* {
  std::size_t index = 0;
  const char* last = choice.data() + choice.size();
  auto [ptr, ec] = std::from_chars(choice.data(), last, index);
  if (ec != std::errc{} || ptr != last || index == 0) return nullptr;
  for (const auto& s : kScenarios) {
    if (s.group != group) continue;
    if (--index == 0) return &s;
  }
  return nullptr;
}

auto run_scenario(const scenario& s, std::ostream& out, const demo_options& opts) -> scenario_result {
  core::trace("demo", "running " + std::string(s.name));
  auto result = s.run(out, opts);
  if (!result) {
    core::trace("demo", std::string(s.name) + " failed: " + core::describe(result.error()));
  }
  return result;
}

auto run_group(scenario_group group, std::ostream& out, const demo_options& opts) -> scenario_result {
  for (const auto& s : kScenarios) {
    if (s.group != group) continue;
    if (auto r = run_scenario(s, out, opts); !r) return r;
  }
  return {};
}

auto run_all(std::ostream& out, const demo_options& opts) -> scenario_result {
  for (const auto& s : kScenarios) {
    if (auto r = run_scenario(s, out, opts); !r) return r;
  }
  return {};
}

} // namespace criteria::demo
