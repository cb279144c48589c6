#include "criteria/wms/client_rules.hpp"

#include <chrono>
#include <string>

#include "rule_support.hpp"

namespace criteria::wms::client_rules {

auto is_active() -> predicate<client> {
  return predicate<client>::of([](const client& c) { return c.is_active; }, "client.is_active");
}

auto is_tier(client_tier tier) -> predicate<client> {
  return predicate<client>::of([tier](const client& c) { return c.tier == tier; },
                               detail::tagged("client.is_tier", to_string(tier)));
}

auto has_expired_contract(wall_clock clock) -> predicate<client> {
  return predicate<client>::of(
      [clock](const client& c) { return c.contract_end.has_value() && *c.contract_end < clock.now(); },
      "client.has_expired_contract");
}

auto contract_expiring(int days, wall_clock clock) -> std::expected<predicate<client>, core::error> {
  if (days < 0) return detail::reject("days until expiration must be non-negative", "wms.client_rules");
  return predicate<client>::of(
      [days, clock](const client& c) {
        if (!c.contract_end) return false;
        const auto remaining = whole_days(clock.now(), *c.contract_end);
        return remaining >= 0 && remaining <= days;
      },
      detail::tagged("client.contract_expiring", std::to_string(days)));
}

auto is_premium_or_enterprise() -> predicate<client> {
  return predicate<client>::of(
      [](const client& c) { return c.tier == client_tier::premium || c.tier == client_tier::enterprise; },
      "client.is_premium_or_enterprise");
}

auto has_long_term_contract() -> predicate<client> {
  return predicate<client>::of(
      [](const client& c) {
        return c.contract_end.has_value() &&
               (*c.contract_end - c.contract_start) >= std::chrono::days{365};
      },
      "client.has_long_term_contract");
}

} // namespace criteria::wms::client_rules
