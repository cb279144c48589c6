#include <catch2/catch_all.hpp>

#include <chrono>
#include <sstream>
#include <string>

#include "examples/demo/scenarios.hpp"

using namespace criteria;
using namespace criteria::demo;
using Catch::Matchers::ContainsSubstring;

namespace {

auto pinned_options() -> demo_options {
  demo_options opts;
  opts.clock = wms::wall_clock::fixed(std::chrono::sys_days{std::chrono::year{2025} /
                                                            std::chrono::June / 10} +
                                      std::chrono::hours{9});
  return opts;
}

auto run(std::string_view name, const demo_options& opts = pinned_options()) -> std::string {
  const auto* s = find_scenario(name);
  REQUIRE(s != nullptr);
  std::ostringstream out;
  auto r = run_scenario(*s, out, opts);
  REQUIRE(r);
  return out.str();
}

auto contains(const std::string& text, const std::string& needle) -> bool {
  return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("catalog lists every scenario once", "[demo]") {
  REQUIRE(catalog().size() == 14);
  REQUIRE(find_scenario("low-stock") != nullptr);
  REQUIRE(find_scenario("low-stock")->group == scenario_group::warehouse);
  REQUIRE(find_scenario("attribute-query")->group == scenario_group::query);
  REQUIRE(find_scenario("nope") == nullptr);

  int simple = 0;
  for (const auto& s : catalog()) {
    REQUIRE(s.run != nullptr);
    REQUIRE(find_scenario(s.name) == &s);
    if (s.group == scenario_group::simple) ++simple;
  }
  REQUIRE(simple == 5);
}

TEST_CASE("simple scenarios", "[demo]") {
  const auto users = run("users");
  REQUIRE_THAT(users, ContainsSubstring("user1") && ContainsSubstring("user4"));
  REQUIRE_FALSE(contains(users, "user2"));
  REQUIRE_FALSE(contains(users, "user3"));
  REQUIRE_THAT(users, ContainsSubstring("Total: 2"));

  const auto emails = run("emails");
  REQUIRE_THAT(emails, ContainsSubstring("[valid]   valid@example.com"));
  REQUIRE_THAT(emails, ContainsSubstring("[invalid] test@spam.com"));
  REQUIRE_THAT(emails, ContainsSubstring("[invalid] (empty)"));
  REQUIRE_THAT(emails, ContainsSubstring("[valid]   admin@company.com"));

  const auto numbers = run("numbers");
  REQUIRE_THAT(numbers, ContainsSubstring("  15, 25, 50, 75\n"));
  REQUIRE_THAT(numbers, ContainsSubstring("  15, 25, 50, 75, 101\n"));

  const auto passwords = run("passwords");
  REQUIRE_THAT(passwords, ContainsSubstring("ValidP@ssw0rd        -> Strong"));
  REQUIRE_THAT(passwords, ContainsSubstring("Long@WithSymbol      -> Weak"));

  const auto negation = run("not");
  REQUIRE_THAT(negation, ContainsSubstring("  2, 4, 6, 8, 10, 12, 14, 16, 18, 20\n"));
  REQUIRE_THAT(negation, ContainsSubstring("  1, 3, 5, 7, 9, 11, 13, 15, 17, 19\n"));
}

TEST_CASE("warehouse scenarios over the sample data", "[demo][wms]") {
  const auto low = run("low-stock");
  REQUIRE_THAT(low, ContainsSubstring("TIRE-001") && ContainsSubstring("CHEM-001") &&
                        ContainsSubstring("NE-GPU-001"));
  REQUIRE_FALSE(contains(low, "Fenty Beauty"));

  const auto expedited = run("expedited");
  REQUIRE_THAT(expedited, ContainsSubstring("immediate processing (2)"));
  REQUIRE_THAT(expedited, ContainsSubstring("Order: ORD-001") && ContainsSubstring("Order: ORD-003"));
  REQUIRE_THAT(expedited, ContainsSubstring("(6.0 hours)"));

  const auto batching = run("batching");
  REQUIRE_THAT(batching, ContainsSubstring("eligible for batching (1)"));
  REQUIRE_THAT(batching, ContainsSubstring("Order IDs: ORD-002"));
  REQUIRE_THAT(batching, ContainsSubstring("Total line items: 2"));

  const auto sla = run("sla");
  REQUIRE_THAT(sla, ContainsSubstring("Shipment: SHIP-002 [Priority: HIGH]"));
  REQUIRE_FALSE(contains(sla, "SHIP-001"));

  const auto cycle = run("cycle-count");
  REQUIRE_THAT(cycle, ContainsSubstring("requiring cycle count (1)"));
  REQUIRE_THAT(cycle, ContainsSubstring("Days since count: 45"));

  const auto international = run("international");
  REQUIRE_THAT(international, ContainsSubstring("Order: ORD-003"));
  REQUIRE_THAT(international, ContainsSubstring("No compliance issues"));
  REQUIRE_FALSE(contains(international, "ORD-001"));

  const auto expiring = run("expiring");
  REQUIRE_THAT(expiring, ContainsSubstring("CRITICAL - Expired (0)"));
  REQUIRE_THAT(expiring, ContainsSubstring("MEDIUM - Expiring within 30 days (1)"));
  REQUIRE_THAT(expiring, ContainsSubstring("FB-FOUND-001"));

  const auto special = run("special-handling");
  REQUIRE_THAT(special, ContainsSubstring("special handling (4)"));
}

TEST_CASE("options change the selection", "[demo][wms]") {
  auto opts = pinned_options();
  opts.domestic_country = "Canada";
  const auto international = run("international", opts);
  REQUIRE_THAT(international, ContainsSubstring("International orders (2)"));

  opts = pinned_options();
  opts.cycle_count_days = 5;
  REQUIRE_THAT(run("cycle-count", opts), ContainsSubstring("requiring cycle count (4)"));
}

TEST_CASE("invalid options surface as errors", "[demo]") {
  auto opts = pinned_options();
  opts.cycle_count_days = -1;
  std::ostringstream out;
  auto r = run_scenario(*find_scenario("cycle-count"), out, opts);
  REQUIRE_FALSE(r);
  REQUIRE(r.error().code == core::error_code::invalid_argument);

  opts = pinned_options();
  opts.domestic_country = " ";
  REQUIRE_FALSE(run_group(scenario_group::warehouse, out, opts));
}

TEST_CASE("attribute query", "[demo][query]") {
  const auto text = run("attribute-query");
  REQUIRE_THAT(text, ContainsSubstring("  - FB-LIP-001 (Beauty, $25.00)"));
  REQUIRE_THAT(text, ContainsSubstring("  - FB-FOUND-001 (Beauty, $40.00)"));
  REQUIRE_THAT(text, ContainsSubstring("  - CHEM-001 (Automotive, $15.00)"));
  REQUIRE_THAT(text, ContainsSubstring("  - TIRE-001 (Automotive, $120.00)"));
  REQUIRE_THAT(text, ContainsSubstring("Query: fragile == \"true\"\n  - FB-LIP-001 (Beauty, $25.00)\n"
                                       "  - NE-GPU-001 (Electronics, $1599.00)\n"
                                       "  - FB-FOUND-001 (Beauty, $40.00)\n"));
}

TEST_CASE("whole catalog runs", "[demo]") {
  std::ostringstream out;
  REQUIRE(run_all(out, pinned_options()));
  REQUIRE_THAT(out.str(), ContainsSubstring("=== Attribute Expression Query ==="));
}

TEST_CASE("menu choices must be whole numbers in range", "[demo]") {
  REQUIRE(pick_in_group(scenario_group::simple, "1") == find_scenario("users"));
  REQUIRE(pick_in_group(scenario_group::simple, "5") == find_scenario("not"));
  REQUIRE(pick_in_group(scenario_group::warehouse, "1") == find_scenario("low-stock"));
  REQUIRE(pick_in_group(scenario_group::warehouse, "8") == find_scenario("international"));

  REQUIRE(pick_in_group(scenario_group::simple, "1abc") == nullptr);
  REQUIRE(pick_in_group(scenario_group::simple, "2 ") == nullptr);
  REQUIRE(pick_in_group(scenario_group::simple, "0") == nullptr);
  REQUIRE(pick_in_group(scenario_group::simple, "6") == nullptr);
  REQUIRE(pick_in_group(scenario_group::simple, "-1") == nullptr);
  REQUIRE(pick_in_group(scenario_group::simple, "") == nullptr);
}
