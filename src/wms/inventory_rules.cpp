#include "criteria/wms/inventory_rules.hpp"

#include <string>
#include <utility>

#include "rule_support.hpp"

namespace criteria::wms::inventory_rules {

namespace {
constexpr const char* kComponent = "wms.inventory_rules";
}

auto belongs_to_client(std::string client_id) -> std::expected<predicate<inventory>, core::error> {
  if (auto ok = detail::require_non_blank(client_id, "client id", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("inventory.belongs_to_client", client_id);
  return predicate<inventory>::of(
      [id = std::move(client_id)](const inventory& i) { return i.client_id == id; }, std::move(name));
}

auto is_at_location(std::string location_id) -> std::expected<predicate<inventory>, core::error> {
  if (auto ok = detail::require_non_blank(location_id, "location id", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("inventory.is_at_location", location_id);
  return predicate<inventory>::of(
      [id = std::move(location_id)](const inventory& i) { return i.location_id == id; },
      std::move(name));
}

auto is_below_reorder_point() -> predicate<inventory> {
  return predicate<inventory>::of(
      [](const inventory& i) {
        return i.quantity <= i.reorder_point && i.status == inventory_status::available;
      },
      "inventory.is_below_reorder_point");
}

auto is_out_of_stock() -> predicate<inventory> {
  return predicate<inventory>::of([](const inventory& i) { return i.quantity == 0; },
                                  "inventory.is_out_of_stock");
}

auto is_near_capacity(double threshold) -> std::expected<predicate<inventory>, core::error> {
  if (!(threshold >= 0.0 && threshold <= 1.0)) {
    return detail::reject("threshold percentage must be between 0 and 1", kComponent);
  }
  return predicate<inventory>::of(
      [threshold](const inventory& i) {
        if (i.max_quantity == 0) return false;
        return static_cast<double>(i.quantity) / static_cast<double>(i.max_quantity) >= threshold;
      },
      detail::tagged("inventory.is_near_capacity", threshold));
}

auto has_status(inventory_status status) -> predicate<inventory> {
  return predicate<inventory>::of([status](const inventory& i) { return i.status == status; },
                                  detail::tagged("inventory.has_status", to_string(status)));
}

auto is_in_quarantine(wall_clock clock) -> predicate<inventory> {
  return predicate<inventory>::of(
      [clock](const inventory& i) {
        return i.status == inventory_status::quarantine && i.quarantine_until.has_value() &&
               *i.quarantine_until > clock.now();
      },
      "inventory.is_in_quarantine");
}

auto can_release_from_quarantine(wall_clock clock) -> predicate<inventory> {
  return predicate<inventory>::of(
      [clock](const inventory& i) {
        return i.status == inventory_status::quarantine && i.quarantine_until.has_value() &&
               *i.quarantine_until <= clock.now();
      },
      "inventory.can_release_from_quarantine");
}

auto needs_cycle_count(int days, wall_clock clock)
    -> std::expected<predicate<inventory>, core::error> {
  if (days < 0) return detail::reject("days since last count must be non-negative", kComponent);
  return predicate<inventory>::of(
      [days, clock](const inventory& i) { return whole_days(i.last_count_date, clock.now()) > days; },
      detail::tagged("inventory.needs_cycle_count", std::to_string(days)));
}

auto is_available() -> predicate<inventory> {
  return predicate<inventory>::of(
      [](const inventory& i) { return i.status == inventory_status::available && i.quantity > 0; },
      "inventory.is_available");
}

auto requires_immediate_attention() -> predicate<inventory> {
  return predicate<inventory>::of(
      [](const inventory& i) {
        return i.status == inventory_status::damaged || i.status == inventory_status::expired ||
               (i.quantity == 0 && i.status == inventory_status::available);
      },
      "inventory.requires_immediate_attention");
}

} // namespace criteria::wms::inventory_rules
