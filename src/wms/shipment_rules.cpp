#include "criteria/wms/shipment_rules.hpp"

#include <string>
#include <utility>

#include "rule_support.hpp"

namespace criteria::wms::shipment_rules {

namespace {
constexpr const char* kComponent = "wms.shipment_rules";
}

auto belongs_to_client(std::string client_id) -> std::expected<predicate<shipment>, core::error> {
  if (auto ok = detail::require_non_blank(client_id, "client id", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("shipment.belongs_to_client", client_id);
  return predicate<shipment>::of(
      [id = std::move(client_id)](const shipment& s) { return s.client_id == id; }, std::move(name));
}

auto has_status(shipment_status status) -> predicate<shipment> {
  return predicate<shipment>::of([status](const shipment& s) { return s.status == status; },
                                 detail::tagged("shipment.has_status", to_string(status)));
}

auto is_carrier(std::string carrier) -> std::expected<predicate<shipment>, core::error> {
  if (auto ok = detail::require_non_blank(carrier, "carrier", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("shipment.is_carrier", carrier);
  return predicate<shipment>::of(
      [wanted = std::move(carrier)](const shipment& s) { return core::iequals(s.carrier, wanted); },
      std::move(name));
}

auto is_delayed() -> predicate<shipment> {
  return predicate<shipment>::of(
      [](const shipment& s) {
        return s.status == shipment_status::delayed || s.status == shipment_status::exception;
      },
      "shipment.is_delayed");
}

auto is_in_transit() -> predicate<shipment> {
  return predicate<shipment>::of(
      [](const shipment& s) {
        return s.status == shipment_status::in_transit ||
               s.status == shipment_status::out_for_delivery;
      },
      "shipment.is_in_transit");
}

auto is_delivered() -> predicate<shipment> {
  return predicate<shipment>::of(
      [](const shipment& s) {
        return s.status == shipment_status::delivered && s.delivery_date.has_value();
      },
      "shipment.is_delivered");
}

auto is_shipped_in_date_range(time_point start, time_point end)
    -> std::expected<predicate<shipment>, core::error> {
  if (end < start) return detail::reject("end date must be on or after start date", kComponent);
  return predicate<shipment>::of(
      [start, end](const shipment& s) { return s.ship_date >= start && s.ship_date <= end; },
      detail::tagged("shipment.is_shipped_in_date_range", format_date(start) + ".." + format_date(end)));
}

auto has_long_delivery_time(int expected_days) -> std::expected<predicate<shipment>, core::error> {
  if (expected_days <= 0) return detail::reject("expected days must be positive", kComponent);
  return predicate<shipment>::of(
      [expected_days](const shipment& s) {
        if (!s.delivery_date) return false;
        return whole_days(s.ship_date, *s.delivery_date) > expected_days;
      },
      detail::tagged("shipment.has_long_delivery_time", std::to_string(expected_days)));
}

auto is_heavy_shipment(double threshold) -> std::expected<predicate<shipment>, core::error> {
  if (!(threshold > 0.0)) return detail::reject("weight threshold must be positive", kComponent);
  return predicate<shipment>::of([threshold](const shipment& s) { return s.weight > threshold; },
                                 detail::tagged("shipment.is_heavy_shipment", threshold));
}

auto is_returned() -> predicate<shipment> {
  return predicate<shipment>::of(
      [](const shipment& s) { return s.status == shipment_status::returned; },
      "shipment.is_returned");
}

auto is_shipped_today(wall_clock clock) -> predicate<shipment> {
  return predicate<shipment>::of(
      [clock](const shipment& s) { return same_day(s.ship_date, clock.now()); },
      "shipment.is_shipped_today");
}

auto has_delivery_issues() -> predicate<shipment> {
  return predicate<shipment>::of(
      [](const shipment& s) {
        return s.status == shipment_status::delayed || s.status == shipment_status::exception ||
               s.status == shipment_status::returned;
      },
      "shipment.has_delivery_issues");
}

} // namespace criteria::wms::shipment_rules
