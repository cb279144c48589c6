#include "criteria/wms/order_rules.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include "rule_support.hpp"

namespace criteria::wms::order_rules {

namespace {

constexpr const char* kComponent = "wms.order_rules";

auto is_urgent_priority(order_priority p) -> bool {
  return p == order_priority::rush || p == order_priority::same_day;
}

} // namespace

auto belongs_to_client(std::string client_id) -> std::expected<predicate<order>, core::error> {
  if (auto ok = detail::require_non_blank(client_id, "client id", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("order.belongs_to_client", client_id);
  return predicate<order>::of(
      [id = std::move(client_id)](const order& o) { return o.client_id == id; }, std::move(name));
}

auto has_priority(order_priority priority) -> predicate<order> {
  return predicate<order>::of([priority](const order& o) { return o.priority == priority; },
                              detail::tagged("order.has_priority", to_string(priority)));
}

auto is_urgent() -> predicate<order> {
  return predicate<order>::of([](const order& o) { return is_urgent_priority(o.priority); },
                              "order.is_urgent");
}

auto has_status(order_status status) -> predicate<order> {
  return predicate<order>::of([status](const order& o) { return o.status == status; },
                              detail::tagged("order.has_status", to_string(status)));
}

auto is_overdue(wall_clock clock) -> predicate<order> {
  return predicate<order>::of(
      [clock](const order& o) {
        if (!(o.required_date < clock.now())) return false;
        switch (o.status) {
          case order_status::shipped:
          case order_status::delivered:
          case order_status::cancelled:
            return false;
          default:
            return true;
        }
      },
      "order.is_overdue");
}

auto is_due_soon(int hours, wall_clock clock) -> std::expected<predicate<order>, core::error> {
  if (hours < 0) return detail::reject("hours until due must be non-negative", kComponent);
  return predicate<order>::of(
      [hours, clock](const order& o) {
        const double remaining = hours_between(clock.now(), o.required_date);
        return remaining > 0.0 && remaining <= static_cast<double>(hours);
      },
      detail::tagged("order.is_due_soon", std::to_string(hours)));
}

auto is_international(std::string domestic_country) -> std::expected<predicate<order>, core::error> {
  if (auto ok = detail::require_non_blank(domestic_country, "domestic country", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("order.is_international", domestic_country);
  return predicate<order>::of(
      [domestic = std::move(domestic_country)](const order& o) {
        return !core::iequals(o.destination_country, domestic);
      },
      std::move(name));
}

auto has_shipping_method(shipping_method method) -> predicate<order> {
  return predicate<order>::of([method](const order& o) { return o.method == method; },
                              detail::tagged("order.has_shipping_method", to_string(method)));
}

auto is_ready_to_ship() -> predicate<order> {
  return predicate<order>::of([](const order& o) { return o.status == order_status::packed; },
                              "order.is_ready_to_ship");
}

auto is_completely_picked() -> predicate<order> {
  return predicate<order>::of(
      [](const order& o) {
        return std::all_of(o.lines.begin(), o.lines.end(), [](const order_line& l) {
          return l.quantity_picked >= l.quantity_ordered;
        });
      },
      "order.is_completely_picked");
}

auto has_partial_picks() -> predicate<order> {
  return predicate<order>::of(
      [](const order& o) {
        return std::any_of(o.lines.begin(), o.lines.end(), [](const order_line& l) {
          return l.quantity_picked > 0 && l.quantity_picked < l.quantity_ordered;
        });
      },
      "order.has_partial_picks");
}

auto is_large_order(int line_threshold) -> std::expected<predicate<order>, core::error> {
  if (line_threshold <= 0) return detail::reject("line item threshold must be positive", kComponent);
  return predicate<order>::of(
      [line_threshold](const order& o) {
        return o.lines.size() > static_cast<std::size_t>(line_threshold);
      },
      detail::tagged("order.is_large_order", std::to_string(line_threshold)));
}

auto requires_expedited_processing(wall_clock clock) -> predicate<order> {
  return predicate<order>::of(
      [clock](const order& o) {
        return is_urgent_priority(o.priority) || o.method == shipping_method::overnight ||
               o.method == shipping_method::two_day_air ||
               hours_between(clock.now(), o.required_date) < 8.0;
      },
      "order.requires_expedited_processing");
}

auto is_placed_today(wall_clock clock) -> predicate<order> {
  return predicate<order>::of([clock](const order& o) { return same_day(o.order_date, clock.now()); },
                              "order.is_placed_today");
}

} // namespace criteria::wms::order_rules
